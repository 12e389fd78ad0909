#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/date.hpp"

namespace tasksync {

enum class Status {
    None,
    Pending,
    Doing,
    Waiting,
    Done,
    Cancelled,
    Unknown
};

// Placeholder for recurrence rules. The payload is carried verbatim.
struct RepeatRule {
    nlohmann::json rules = nlohmann::json::object();
};

struct Task {
    std::int64_t id = 0;
    std::string name;
    Status status{Status::None};
    std::string priority = "N";
    Date created;
    std::int64_t display_order = 0;

    // Required-nullable: the key is always materialised in the store.
    std::optional<Date> due;
    std::optional<Date> updated;
    std::optional<Date> completed;

    // Optional: removed from the store entirely when absent. An empty
    // vector means absent for contexts, tags and subtasks.
    std::optional<std::string> project;
    std::vector<std::string> contexts;
    std::vector<std::string> tags;
    std::optional<std::string> notes;
    std::vector<Task> subtasks;

    // Store-only payload; null when absent, otherwise an object.
    nlohmann::json extra;
    std::optional<RepeatRule> repeat;
};

std::string to_string(Status status);
Status parse_status(const std::string& word);

char status_marker(Status status);
Status status_from_marker(char marker);

// Number of tasks in the forest, nested subtasks included.
std::size_t count_tasks(const std::vector<Task>& forest);

bool operator==(const RepeatRule& a, const RepeatRule& b);
bool operator==(const Task& a, const Task& b);
bool operator!=(const Task& a, const Task& b);

}
