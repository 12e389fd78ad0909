#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasksync::markdown {

// Line shape `[marker] (PRIORITY)? name attributes*`, indentation and list
// marker already stripped.
struct BaseShape {
    char status_marker = ' ';
    std::optional<std::string> priority;
    std::string name;
    std::string attributes;
};

enum class DateAttribute { Created, Due, Updated, Completed };

struct DateToken {
    std::string text;
    bool cleared = false;  // written as ""
};

struct NoteSpan {
    std::string raw;       // still escaped
    std::size_t begin = 0;
    std::size_t length = 0;
};

namespace grammar {

// A `[[name]]` closes at the last two brackets of the first run of two or
// more `]`, so names may end in `]`.
std::optional<BaseShape> match_base(const std::string& line);

// Every matcher below scans the whitespace-separated tokens of the attribute
// tail independently, so attributes may come in any order. The first
// occurrence wins; unknown tokens are ignored.
std::optional<std::string> find_id(const std::string& attributes);
std::optional<DateToken> find_date(const std::string& attributes, DateAttribute which);
std::optional<std::string> find_project(const std::string& attributes);
std::vector<std::string> find_contexts(const std::string& attributes);
std::vector<std::string> find_tags(const std::string& attributes);
std::optional<NoteSpan> find_note(const std::string& attributes);

// Attribute tail with the note segment cut out, so text inside a note is
// never read as another attribute.
std::string without_note(const std::string& attributes, const NoteSpan& note);

std::string unescape_note(const std::string& raw);
std::string escape_note(const std::string& text);

const char* attribute_key(DateAttribute which);

// Values the line form can carry and read back unchanged.
bool is_priority_token(std::string_view value);
bool is_bare_token(std::string_view value);   // +project, @context, #tag
bool is_line_name(std::string_view name);
bool is_single_line(std::string_view text);

}

}
