#pragma once

#include <cstdint>
#include <vector>

#include "model/task.hpp"
#include "utils/date.hpp"

namespace tasksync::merge {

struct MergeResult {
    std::vector<Task> tasks;             // new store content, display_order 1..N
    std::vector<std::int64_t> added;     // in new-document order
    std::vector<std::int64_t> updated;   // in new-document order
    std::vector<std::int64_t> deleted;   // in previous-store order
};

// Reconciles a freshly parsed forest against the previous store. Matching is
// by identifier on root records only; a matched record takes every editable
// field from the edit (absent included) and keeps id, created, extra and
// repeat. Subtask trees are replaced whole. Identifiers missing from the edit
// are dropped.
class MergeEngine {
public:
    explicit MergeEngine(Date processing_date);

    MergeResult merge(std::vector<Task> previous, std::vector<Task> edited) const;

private:
    void apply_edit(Task& stored, Task&& edited) const;

    Date processing_date_;
};

MergeResult merge_tasks(std::vector<Task> previous, std::vector<Task> edited, const Date& processing_date);

}
