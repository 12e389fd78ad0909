#pragma once

#include <string>
#include <vector>

#include "markdown/hierarchy_builder.hpp"
#include "model/task.hpp"

namespace tasksync::markdown {

// Single task line without indentation or list marker:
// `[m] (P) [[name]] id:.. due:.. +project @ctx #tag created:.. updated:.. completed:.. note:".."`
std::string render_task_content(const Task& task);

// Forest to document, subtasks one indent unit deeper than their parent.
// Every line ends with '\n'.
std::string render_document(const std::vector<Task>& forest, int indent_width = kDefaultIndentWidth);

}
