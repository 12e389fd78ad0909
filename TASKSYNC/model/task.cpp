#include "model/task.hpp"

#include <cctype>

#include "utils/string_utils.hpp"

namespace tasksync {

std::string to_string(Status status) {
    switch (status) {
        case Status::None:      return "none";
        case Status::Pending:   return "pending";
        case Status::Doing:     return "doing";
        case Status::Waiting:   return "waiting";
        case Status::Done:      return "done";
        case Status::Cancelled: return "cancelled";
        case Status::Unknown:   return "unknown";
    }
    return "unknown";
}

Status parse_status(const std::string& word) {
    const std::string t = strings::to_lower_copy(strings::trim_copy(word));
    if (t == "none" || t == "open" || t.empty()) return Status::None;
    if (t == "pending") return Status::Pending;
    if (t == "doing") return Status::Doing;
    if (t == "waiting") return Status::Waiting;
    if (t == "done") return Status::Done;
    if (t == "cancelled") return Status::Cancelled;
    return Status::Unknown;
}

char status_marker(Status status) {
    switch (status) {
        case Status::None:      return ' ';
        case Status::Pending:   return 'p';
        case Status::Doing:     return '>';
        case Status::Waiting:   return 'w';
        case Status::Done:      return 'x';
        case Status::Cancelled: return 'c';
        case Status::Unknown:   return '?';
    }
    return '?';
}

Status status_from_marker(char marker) {
    switch (std::tolower(static_cast<unsigned char>(marker))) {
        case ' ': return Status::None;
        case 'p': return Status::Pending;
        case '>': return Status::Doing;
        case 'w': return Status::Waiting;
        case 'x': return Status::Done;
        case 'c': return Status::Cancelled;
        default:  return Status::Unknown;
    }
}

std::size_t count_tasks(const std::vector<Task>& forest) {
    std::size_t n = 0;
    for (const Task& t : forest) {
        n += 1 + count_tasks(t.subtasks);
    }
    return n;
}

bool operator==(const RepeatRule& a, const RepeatRule& b) {
    return a.rules == b.rules;
}

bool operator==(const Task& a, const Task& b) {
    return a.id == b.id &&
           a.name == b.name &&
           a.status == b.status &&
           a.priority == b.priority &&
           a.created == b.created &&
           a.display_order == b.display_order &&
           a.due == b.due &&
           a.updated == b.updated &&
           a.completed == b.completed &&
           a.project == b.project &&
           a.contexts == b.contexts &&
           a.tags == b.tags &&
           a.notes == b.notes &&
           a.subtasks == b.subtasks &&
           a.extra == b.extra &&
           a.repeat == b.repeat;
}

bool operator!=(const Task& a, const Task& b) {
    return !(a == b);
}

}
