#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace tasksync {

// A task line whose base shape (marker, priority, name) does not parse.
// Aborts the whole document.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::string line_text, std::size_t line_number)
        : std::runtime_error(message),
          line_text_(std::move(line_text)),
          line_number_(line_number) {}

    const std::string& line_text() const { return line_text_; }
    // 1-based position in the document, 0 when parsing a lone line.
    std::size_t line_number() const { return line_number_; }

private:
    std::string line_text_;
    std::size_t line_number_ = 0;
};

// A persisted record that cannot be decoded, or a store file that cannot be
// read or written. Aborts the whole load or save.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message, std::size_t record_line = 0)
        : std::runtime_error(message), record_line_(record_line) {}

    std::size_t record_line() const { return record_line_; }

private:
    std::size_t record_line_ = 0;
};

}
