#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/task.hpp"

namespace tasksync::store {

// One record per task, nested subtasks inline. Throws StoreError when the
// record is not decodable.
nlohmann::json task_to_json(const Task& task);
Task task_from_json(const nlohmann::json& record);

// JSON Lines: one root record per line, blank lines skipped on decode.
std::vector<Task> decode_records(const std::string& text);
std::string encode_records(const std::vector<Task>& tasks);

class TaskStore {
public:
    explicit TaskStore(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }
    bool exists() const;

    // A store file that does not exist yet loads as an empty collection.
    std::vector<Task> load() const;

    // Replaces the whole file through a temp file and rename.
    void save(const std::vector<Task>& tasks) const;

private:
    std::filesystem::path path_;
};

}
