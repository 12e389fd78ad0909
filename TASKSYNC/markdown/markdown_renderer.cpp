#include "markdown/markdown_renderer.hpp"

#include <optional>
#include <sstream>

#include "markdown/attribute_grammar.hpp"

namespace tasksync::markdown {

namespace {

std::string nullable_date(const char* key, const std::optional<Date>& value) {
    return std::string(key) + ":" + (value ? value->to_string() : std::string("\"\""));
}

void render_recursive(const Task& task, int depth, int indent_width, std::ostringstream& out) {
    out << std::string(static_cast<std::size_t>(depth * indent_width), ' ')
        << "- " << render_task_content(task) << '\n';
    for (const Task& child : task.subtasks) {
        render_recursive(child, depth + 1, indent_width, out);
    }
}

}

std::string render_task_content(const Task& task) {
    std::ostringstream out;
    out << '[' << status_marker(task.status) << "] "
        << '(' << (task.priority.empty() ? std::string("N") : task.priority) << ") "
        << "[[" << task.name << "]]";

    out << " id:" << task.id;
    out << ' ' << nullable_date("due", task.due);
    if (task.project) {
        out << " +" << *task.project;
    }
    for (const std::string& context : task.contexts) {
        out << " @" << context;
    }
    for (const std::string& tag : task.tags) {
        out << " #" << tag;
    }
    out << " created:" << task.created.to_string();
    out << ' ' << nullable_date("updated", task.updated);
    out << ' ' << nullable_date("completed", task.completed);
    if (task.notes) {
        out << " note:\"" << grammar::escape_note(*task.notes) << '"';
    }
    return out.str();
}

std::string render_document(const std::vector<Task>& forest, int indent_width) {
    std::ostringstream out;
    for (const Task& task : forest) {
        render_recursive(task, 0, indent_width > 0 ? indent_width : kDefaultIndentWidth, out);
    }
    return out.str();
}

}
