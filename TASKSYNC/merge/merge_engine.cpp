#include "merge/merge_engine.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "utils/log.hpp"

namespace tasksync::merge {

MergeEngine::MergeEngine(Date processing_date) : processing_date_(processing_date) {}

void MergeEngine::apply_edit(Task& stored, Task&& edited) const {
    stored.name = std::move(edited.name);
    stored.status = edited.status;
    stored.priority = std::move(edited.priority);

    stored.due = edited.due;
    stored.completed = edited.completed;

    stored.notes = std::move(edited.notes);
    stored.project = std::move(edited.project);
    stored.contexts = std::move(edited.contexts);
    stored.tags = std::move(edited.tags);
    stored.subtasks = std::move(edited.subtasks);

    // The typed value of updated: is never kept; the tool stamps it.
    stored.updated = processing_date_;
    stored.display_order = edited.display_order;
}

MergeResult MergeEngine::merge(std::vector<Task> previous, std::vector<Task> edited) const {
    MergeResult result;

    std::vector<std::int64_t> previous_order;
    previous_order.reserve(previous.size());
    std::unordered_map<std::int64_t, Task> by_id;
    by_id.reserve(previous.size());
    for (Task& task : previous) {
        const std::int64_t id = task.id;
        const bool inserted = by_id.insert_or_assign(id, std::move(task)).second;
        if (inserted) {
            previous_order.push_back(id);
        } else {
            log::warn("[MergeEngine] stored collection repeats id " + std::to_string(id) + "; last record wins");
        }
    }

    std::unordered_set<std::int64_t> seen;
    result.tasks.reserve(edited.size());
    for (Task& md_task : edited) {
        const std::int64_t id = md_task.id;
        const bool first_occurrence = seen.insert(id).second;
        auto it = first_occurrence ? by_id.find(id) : by_id.end();
        if (it != by_id.end()) {
            Task stored = std::move(it->second);
            by_id.erase(it);
            apply_edit(stored, std::move(md_task));
            result.updated.push_back(id);
            result.tasks.push_back(std::move(stored));
        } else {
            if (!first_occurrence) {
                log::warn("[MergeEngine] id " + std::to_string(id) + " appears more than once; keeping the extra line as a new record");
            }
            md_task.updated = processing_date_;
            result.added.push_back(id);
            result.tasks.push_back(std::move(md_task));
        }
    }

    for (std::int64_t id : previous_order) {
        if (by_id.count(id) != 0) {
            result.deleted.push_back(id);
        }
    }

    std::stable_sort(result.tasks.begin(), result.tasks.end(),
                     [](const Task& a, const Task& b) { return a.display_order < b.display_order; });
    std::int64_t order = 1;
    for (Task& task : result.tasks) {
        task.display_order = order++;
    }

    log::info("[MergeEngine] " + std::to_string(result.added.size()) + " added, " +
              std::to_string(result.updated.size()) + " updated, " +
              std::to_string(result.deleted.size()) + " deleted");
    return result;
}

MergeResult merge_tasks(std::vector<Task> previous, std::vector<Task> edited, const Date& processing_date) {
    return MergeEngine(processing_date).merge(std::move(previous), std::move(edited));
}

}
