#include "markdown/hierarchy_builder.hpp"

#include <utility>

#include "core/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace tasksync::markdown {

bool IdAllocator::reserve(std::int64_t id) {
    return used_.insert(id).second;
}

std::int64_t IdAllocator::allocate() {
    while (used_.count(next_) != 0) {
        ++next_;
    }
    const std::int64_t id = next_++;
    used_.insert(id);
    return id;
}

HierarchyBuilder::HierarchyBuilder(ParseContext ctx, int indent_width)
    : ctx_(ctx), indent_width_(indent_width > 0 ? indent_width : kDefaultIndentWidth) {}

bool HierarchyBuilder::is_task_line(const std::string& line) {
    const std::string t = strings::trim_copy(line);
    return !t.empty() && strings::starts_with(t, "- [");
}

int HierarchyBuilder::indentation_depth(const std::string& line) const {
    int columns = 0;
    for (char c : line) {
        if (c == ' ') {
            ++columns;
        } else if (c == '\t') {
            columns += indent_width_;
        } else {
            break;
        }
    }
    return columns / indent_width_;
}

std::vector<std::int64_t> HierarchyBuilder::collect_explicit_ids(const std::vector<std::string>& lines) const {
    std::vector<std::int64_t> ids;
    for (const std::string& line : lines) {
        if (!is_task_line(line)) continue;
        if (auto id = explicit_id(line)) {
            ids.push_back(*id);
        }
    }
    return ids;
}

std::vector<ParsedLine> HierarchyBuilder::parse_task_lines(const std::vector<std::string>& lines,
                                                           IdAllocator& ids) const {
    std::vector<ParsedLine> arena;
    std::unordered_set<std::int64_t> seen;
    std::int64_t display_order = 1;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (!is_task_line(line)) continue;

        ParsedLine parsed;
        parsed.line_number = i + 1;
        parsed.depth = indentation_depth(line);
        try {
            parsed.task = parse_line(line, ctx_, display_order);
        } catch (const ParseError& e) {
            throw ParseError("line " + std::to_string(i + 1) + ": " + e.what(), line, i + 1);
        }
        ++display_order;

        Task& task = parsed.task;
        if (task.id != 0) {
            ids.reserve(task.id);
            if (!seen.insert(task.id).second) {
                log::warn("[HierarchyBuilder] duplicate id:" + std::to_string(task.id) +
                          " on line " + std::to_string(i + 1));
            }
        } else {
            task.id = ids.allocate();
            seen.insert(task.id);
        }
        arena.push_back(std::move(parsed));
    }
    return arena;
}

std::vector<Task> HierarchyBuilder::assemble_forest(std::vector<ParsedLine> arena) {
    const std::size_t n = arena.size();
    std::vector<std::vector<std::size_t>> children(n);
    std::vector<std::size_t> roots;

    // (arena index, depth) chain of potential ancestors.
    std::vector<std::pair<std::size_t, int>> stack;
    for (std::size_t i = 0; i < n; ++i) {
        const int depth = arena[i].depth;
        while (!stack.empty() && stack.back().second >= depth) {
            stack.pop_back();
        }
        if (stack.empty()) {
            roots.push_back(i);
        } else {
            children[stack.back().first].push_back(i);
        }
        stack.emplace_back(i, depth);
    }

    // Children always sit after their parent in the arena, so a reverse pass
    // completes every child before it is moved under its parent.
    for (std::size_t i = n; i-- > 0;) {
        Task& parent = arena[i].task;
        parent.subtasks.reserve(children[i].size());
        for (std::size_t child : children[i]) {
            parent.subtasks.push_back(std::move(arena[child].task));
        }
    }

    std::vector<Task> forest;
    forest.reserve(roots.size());
    for (std::size_t root : roots) {
        forest.push_back(std::move(arena[root].task));
    }
    return forest;
}

std::vector<Task> HierarchyBuilder::build(const std::string& document) const {
    const std::vector<std::string> lines = strings::split_lines(document);

    IdAllocator ids;
    for (std::int64_t id : collect_explicit_ids(lines)) {
        ids.reserve(id);
    }

    std::vector<ParsedLine> arena = parse_task_lines(lines, ids);
    const std::size_t task_count = arena.size();
    std::vector<Task> forest = assemble_forest(std::move(arena));
    log::debug("[HierarchyBuilder] parsed " + std::to_string(task_count) + " task(s) into " +
               std::to_string(forest.size()) + " root(s)");
    return forest;
}

std::vector<Task> parse_document(const std::string& document, const ParseContext& ctx, int indent_width) {
    return HierarchyBuilder(ctx, indent_width).build(document);
}

}
