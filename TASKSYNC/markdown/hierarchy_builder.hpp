#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "markdown/line_parser.hpp"
#include "model/task.hpp"

namespace tasksync::markdown {

constexpr int kDefaultIndentWidth = 4;

// Hands out the smallest positive identifier not yet reserved. One allocator
// per document, so independent documents never share counters.
class IdAllocator {
public:
    // Returns false when the id was already reserved.
    bool reserve(std::int64_t id);
    std::int64_t allocate();

private:
    std::unordered_set<std::int64_t> used_;
    std::int64_t next_ = 1;
};

// One task line after parsing, before tree assembly.
struct ParsedLine {
    Task task;
    int depth = 0;
    std::size_t line_number = 0;
};

class HierarchyBuilder {
public:
    explicit HierarchyBuilder(ParseContext ctx, int indent_width = kDefaultIndentWidth);

    // Whole document to forest of roots. Throws ParseError on the first
    // malformed task line; no partial result is produced.
    std::vector<Task> build(const std::string& document) const;

    // Stage 1: every identifier explicitly written anywhere in the document.
    std::vector<std::int64_t> collect_explicit_ids(const std::vector<std::string>& lines) const;

    // Stage 2: parse task lines in order, resolving identifiers against the
    // allocator seeded by stage 1.
    std::vector<ParsedLine> parse_task_lines(const std::vector<std::string>& lines, IdAllocator& ids) const;

    // Stage 3: indentation stack over the flat arena, materialised into owned subtrees.
    static std::vector<Task> assemble_forest(std::vector<ParsedLine> arena);

    int indentation_depth(const std::string& line) const;
    static bool is_task_line(const std::string& line);

private:
    ParseContext ctx_;
    int indent_width_ = kDefaultIndentWidth;
};

// Convenience wrapper over HierarchyBuilder::build.
std::vector<Task> parse_document(const std::string& document,
                                 const ParseContext& ctx,
                                 int indent_width = kDefaultIndentWidth);

}
