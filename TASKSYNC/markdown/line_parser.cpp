#include "markdown/line_parser.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>
#include <vector>

#include "core/errors.hpp"
#include "markdown/attribute_grammar.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace tasksync::markdown {

namespace {

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc() && res.ptr == last;
}

std::optional<std::int64_t> parse_id_value(const std::string& digits) {
    std::int64_t value = 0;
    const char* last = digits.data() + digits.size();
    auto res = std::from_chars(digits.data(), last, value);
    if (res.ec != std::errc() || res.ptr != last || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<Date> resolve_date_attribute(const std::string& attributes,
                                           DateAttribute which,
                                           const ParseContext& ctx) {
    auto token = grammar::find_date(attributes, which);
    if (!token || token->cleared) {
        return std::nullopt;
    }
    auto date = parse_date_literal(token->text, ctx.reference_year);
    if (!date) {
        log::debug(std::string("[LineParser] ignoring malformed ") + grammar::attribute_key(which) +
                   " value '" + token->text + "'");
    }
    return date;
}

}

std::optional<Date> parse_date_literal(const std::string& text, int reference_year) {
    const auto dashes = std::count(text.begin(), text.end(), '-');
    const auto slashes = std::count(text.begin(), text.end(), '/');

    std::vector<std::string> parts;
    char sep = '\0';
    if (dashes == 2 && slashes == 0) sep = '-';
    else if (slashes == 2 && dashes == 0) sep = '/';
    else if (slashes == 1 && dashes == 0) sep = '/';
    else return std::nullopt;

    std::size_t start = 0;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == sep) {
            parts.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }

    int year = reference_year;
    int month = 0;
    int day = 0;
    if (parts.size() == 3) {
        if (parts[0].size() != 4 || parts[1].size() > 2 || parts[2].size() > 2) return std::nullopt;
        if (!parse_int(parts[0], year) || !parse_int(parts[1], month) || !parse_int(parts[2], day)) {
            return std::nullopt;
        }
    } else if (parts.size() == 2) {
        if (parts[0].size() > 2 || parts[1].size() > 2) return std::nullopt;
        if (!parse_int(parts[0], month) || !parse_int(parts[1], day)) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    return Date::from_ymd(year, month, day);
}

std::optional<std::int64_t> explicit_id(const std::string& line) {
    auto shape = grammar::match_base(strip_list_marker(line));
    if (!shape) {
        return std::nullopt;
    }
    std::string attributes = shape->attributes;
    if (auto note = grammar::find_note(attributes)) {
        attributes = grammar::without_note(attributes, *note);
    }
    auto digits = grammar::find_id(attributes);
    if (!digits) {
        return std::nullopt;
    }
    return parse_id_value(*digits);
}

std::string strip_list_marker(const std::string& line) {
    std::size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '-' || line[i] == '*')) {
        ++i;
    }
    return strings::trim_copy(std::string_view(line).substr(i));
}

Task parse_line(const std::string& line, const ParseContext& ctx, std::int64_t display_order) {
    const std::string content = strip_list_marker(line);
    auto shape = grammar::match_base(content);
    if (!shape) {
        throw ParseError("Line '" + content + "' does not match base task format", line, 0);
    }
    if (!grammar::is_line_name(shape->name)) {
        throw ParseError("Line '" + content + "' has a task name containing ']]'", line, 0);
    }

    Task task;
    task.status = status_from_marker(shape->status_marker);
    task.priority = shape->priority.value_or("N");
    task.name = shape->name;
    task.display_order = display_order;
    task.created = ctx.default_created;

    std::string attributes = shape->attributes;
    if (auto note = grammar::find_note(attributes)) {
        task.notes = grammar::unescape_note(note->raw);
        attributes = grammar::without_note(attributes, *note);
    }

    if (auto digits = grammar::find_id(attributes)) {
        if (auto id = parse_id_value(*digits)) {
            task.id = *id;
        } else {
            log::debug("[LineParser] ignoring unusable id '" + *digits + "'");
        }
    }

    if (auto created = resolve_date_attribute(attributes, DateAttribute::Created, ctx)) {
        task.created = *created;
    }
    task.due = resolve_date_attribute(attributes, DateAttribute::Due, ctx);
    task.updated = resolve_date_attribute(attributes, DateAttribute::Updated, ctx);
    task.completed = resolve_date_attribute(attributes, DateAttribute::Completed, ctx);

    task.project = grammar::find_project(attributes);
    task.contexts = grammar::find_contexts(attributes);
    task.tags = grammar::find_tags(attributes);
    return task;
}

}
