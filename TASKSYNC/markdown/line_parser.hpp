#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "model/task.hpp"
#include "utils/date.hpp"

namespace tasksync::markdown {

// Inputs that are not part of the text itself.
struct ParseContext {
    Date default_created;   // used when a line carries no usable created:
    int reference_year = 1970;  // year implied by MM/DD and M/D spellings

    static ParseContext for_date(const Date& processing_date) {
        return ParseContext{processing_date, processing_date.year};
    }
};

// Accepts YYYY-MM-DD, YYYY/MM/DD, MM/DD and M/D. Returns nullopt for any other
// spelling or for a day that does not exist.
std::optional<Date> parse_date_literal(const std::string& text, int reference_year);

// Explicit identifier authored on the line, if any. Lines that do not match
// the base shape report none.
std::optional<std::int64_t> explicit_id(const std::string& line);

// Strips indentation and the list marker ("- ", "* ") from a raw document line.
std::string strip_list_marker(const std::string& line);

// Parses one line (list marker optional). The returned task has id 0 when the
// line carries no explicit identifier and no subtasks. Throws ParseError when
// the base shape does not match.
Task parse_line(const std::string& line, const ParseContext& ctx, std::int64_t display_order);

}
