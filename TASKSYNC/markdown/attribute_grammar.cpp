#include "markdown/attribute_grammar.hpp"

#include <cctype>
#include <regex>

#include "utils/string_utils.hpp"

namespace tasksync::markdown::grammar {

namespace {

constexpr const char* kDateValue = R"re(\d{4}[-/]\d{1,2}[-/]\d{1,2}|\d{1,2}/\d{1,2})re";
constexpr const char* kClearedValue = R"re("")re";
constexpr std::string_view kNoteOpen = "note:\"";

// Longest date spelling; only this prefix of a value is handed to the regex.
constexpr std::size_t kMaxDateValue = 10;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

const std::regex& date_value_regex(bool allow_cleared) {
    static const std::regex kDate{std::string("^(?:") + kDateValue + ")"};
    static const std::regex kDateOrCleared{std::string("^(?:") + kDateValue + "|" + kClearedValue + ")"};
    return allow_cleared ? kDateOrCleared : kDate;
}

std::vector<std::string_view> split_tokens(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        const std::size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) {
            tokens.push_back(text.substr(start, i - start));
        }
    }
    return tokens;
}

std::vector<std::string> prefixed_values(const std::string& attributes, char sigil) {
    std::vector<std::string> out;
    for (std::string_view token : split_tokens(attributes)) {
        if (token.size() > 1 && token.front() == sigil) {
            out.emplace_back(token.substr(1));
        }
    }
    return out;
}

// Body of `note:"..."` starting at `open`. `""` is an escaped quote; a lone
// `"` closes. With no lone quote left, the last `""` pair closes instead.
std::optional<NoteSpan> scan_note(const std::string& text, std::size_t open) {
    const std::size_t body = open + kNoteOpen.size();
    std::optional<std::size_t> last_pair;
    std::optional<std::size_t> close;
    std::size_t i = body;
    while (i < text.size()) {
        if (text[i] != '"') {
            ++i;
        } else if (i + 1 < text.size() && text[i + 1] == '"') {
            last_pair = i;
            i += 2;
        } else {
            close = i;
            break;
        }
    }
    if (!close) {
        close = last_pair;
    }
    if (!close) {
        return std::nullopt;
    }
    NoteSpan span;
    span.raw = text.substr(body, *close - body);
    span.begin = open;
    span.length = *close + 1 - open;
    return span;
}

}

std::optional<BaseShape> match_base(const std::string& line) {
    const std::size_t n = line.size();
    std::size_t i = 0;
    while (i < n && is_space(line[i])) ++i;
    if (i + 3 > n || line[i] != '[' || line[i + 1] == ']' || line[i + 2] != ']') {
        return std::nullopt;
    }

    BaseShape shape;
    shape.status_marker = line[i + 1];
    i += 3;
    while (i < n && is_space(line[i])) ++i;

    if (i < n && line[i] == '(') {
        const std::size_t close = line.find(')', i + 1);
        if (close != std::string::npos) {
            std::string_view token(line.data() + i + 1, close - i - 1);
            std::size_t next = close + 1;
            while (next < n && is_space(line[next])) ++next;
            // A priority needs a name after it.
            if (is_priority_token(token) && next < n) {
                shape.priority = std::string(token);
                i = next;
            }
        }
    }
    if (i >= n) {
        return std::nullopt;
    }

    if (line.compare(i, 2, "[[") == 0) {
        const std::size_t body = i + 2;
        std::size_t close = line.find("]]", body + 1);
        if (close != std::string::npos) {
            while (close + 2 < n && line[close + 2] == ']') ++close;
            shape.name = line.substr(body, close - body);
            shape.attributes = strings::trim_copy(std::string_view(line).substr(close + 2));
            return shape;
        }
    }
    shape.name = strings::trim_copy(std::string_view(line).substr(i));
    return shape;
}

std::optional<std::string> find_id(const std::string& attributes) {
    for (std::string_view token : split_tokens(attributes)) {
        if (!strings::starts_with(token, "id:")) continue;
        std::size_t end = 3;
        while (end < token.size() && std::isdigit(static_cast<unsigned char>(token[end]))) ++end;
        if (end > 3) {
            return std::string(token.substr(3, end - 3));
        }
    }
    return std::nullopt;
}

std::optional<DateToken> find_date(const std::string& attributes, DateAttribute which) {
    const std::string key = std::string(attribute_key(which)) + ":";
    const std::regex& value_re = date_value_regex(which != DateAttribute::Created);
    for (std::string_view token : split_tokens(attributes)) {
        if (!strings::starts_with(token, key)) continue;
        const std::string head(token.substr(key.size(), kMaxDateValue));
        std::smatch m;
        if (!std::regex_search(head, m, value_re)) continue;
        DateToken date;
        if (m.str(0) == kClearedValue) {
            date.cleared = true;
        } else {
            date.text = m.str(0);
        }
        return date;
    }
    return std::nullopt;
}

std::optional<std::string> find_project(const std::string& attributes) {
    auto values = prefixed_values(attributes, '+');
    if (values.empty()) {
        return std::nullopt;
    }
    return values.front();
}

std::vector<std::string> find_contexts(const std::string& attributes) {
    return prefixed_values(attributes, '@');
}

std::vector<std::string> find_tags(const std::string& attributes) {
    return prefixed_values(attributes, '#');
}

std::optional<NoteSpan> find_note(const std::string& attributes) {
    std::size_t open = attributes.find(kNoteOpen);
    while (open != std::string::npos) {
        if (open == 0 || is_space(attributes[open - 1])) {
            if (auto span = scan_note(attributes, open)) {
                return span;
            }
        }
        open = attributes.find(kNoteOpen, open + 1);
    }
    return std::nullopt;
}

std::string without_note(const std::string& attributes, const NoteSpan& note) {
    std::string out = attributes;
    out.replace(note.begin, note.length, " ");
    return out;
}

std::string unescape_note(const std::string& raw) {
    std::string out = raw;
    strings::replace_all(out, "\"\"", "\"");
    return out;
}

std::string escape_note(const std::string& text) {
    std::string out = text;
    strings::replace_all(out, "\"", "\"\"");
    return out;
}

const char* attribute_key(DateAttribute which) {
    switch (which) {
        case DateAttribute::Created:   return "created";
        case DateAttribute::Due:       return "due";
        case DateAttribute::Updated:   return "updated";
        case DateAttribute::Completed: return "completed";
    }
    return "due";
}

bool is_priority_token(std::string_view value) {
    if (value.empty()) return false;
    for (char c : value) {
        if (is_space(c) || c == '(' || c == ')') return false;
    }
    return true;
}

bool is_bare_token(std::string_view value) {
    if (value.empty()) return false;
    for (char c : value) {
        if (is_space(c)) return false;
    }
    return true;
}

bool is_single_line(std::string_view text) {
    return text.find_first_of("\r\n") == std::string_view::npos;
}

bool is_line_name(std::string_view name) {
    if (name.empty() || !is_single_line(name)) {
        return false;
    }
    // Trailing `]` merge into the closing run; any earlier `]]` past the first
    // character would close the name early.
    const std::size_t last = name.find_last_not_of(']');
    if (last == std::string_view::npos) {
        return true;
    }
    return name.substr(0, last + 1).find("]]", 1) == std::string_view::npos;
}

}
