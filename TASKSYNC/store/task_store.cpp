#include "store/task_store.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/errors.hpp"
#include "markdown/attribute_grammar.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace tasksync::store {

namespace {

const char* const kKnownKeys[] = {
    "id", "name", "status", "priority", "created", "display_order",
    "due", "updated", "completed",
    "project", "contexts", "tags", "notes", "subtasks", "extra", "repeat",
};

bool is_known_key(const std::string& key) {
    for (const char* known : kKnownKeys) {
        if (key == known) return true;
    }
    return false;
}

[[noreturn]] void malformed(const std::string& key, const std::string& what) {
    throw StoreError("field '" + key + "' " + what);
}

const nlohmann::json& required(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        malformed(key, "is missing");
    }
    return *it;
}

// Null when the key is missing or explicitly null.
const nlohmann::json* optional_field(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string string_field(const nlohmann::json& value, const char* key) {
    if (!value.is_string()) {
        malformed(key, "must be a string");
    }
    return value.get<std::string>();
}

std::int64_t integer_field(const nlohmann::json& value, const char* key) {
    if (!value.is_number_integer()) {
        malformed(key, "must be an integer");
    }
    return value.get<std::int64_t>();
}

Date date_field(const nlohmann::json& value, const char* key) {
    const std::string text = string_field(value, key);
    auto date = Date::parse_iso(text);
    if (!date) {
        malformed(key, "is not a YYYY-MM-DD date: '" + text + "'");
    }
    return *date;
}

std::optional<Date> nullable_date(const nlohmann::json& record, const char* key) {
    if (const nlohmann::json* value = optional_field(record, key)) {
        return date_field(*value, key);
    }
    return std::nullopt;
}

std::vector<std::string> string_list(const nlohmann::json& record, const char* key) {
    std::vector<std::string> out;
    const nlohmann::json* value = optional_field(record, key);
    if (!value) {
        return out;
    }
    if (!value->is_array()) {
        malformed(key, "must be an array of strings");
    }
    for (const auto& item : *value) {
        if (!item.is_string()) {
            malformed(key, "must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// Values that would not read back from a markdown line are refused here,
// before they can reach the renderer.
void require_line_value(bool ok, const char* key, const char* what) {
    if (!ok) {
        malformed(key, what);
    }
}

void require_tokens(const std::vector<std::string>& values, const char* key) {
    for (const std::string& value : values) {
        require_line_value(markdown::grammar::is_bare_token(value), key,
                           "must hold non-empty values without whitespace");
    }
}

nlohmann::json encode_date(const std::optional<Date>& date) {
    return date ? nlohmann::json(date->to_string()) : nlohmann::json(nullptr);
}

}

nlohmann::json task_to_json(const Task& task) {
    nlohmann::json record = nlohmann::json::object();
    record["id"] = task.id;
    record["name"] = task.name;
    record["status"] = to_string(task.status);
    record["priority"] = task.priority;
    record["created"] = task.created.to_string();
    record["display_order"] = task.display_order;

    record["due"] = encode_date(task.due);
    record["updated"] = encode_date(task.updated);
    record["completed"] = encode_date(task.completed);

    if (task.project) {
        record["project"] = *task.project;
    }
    if (!task.contexts.empty()) {
        record["contexts"] = task.contexts;
    }
    if (!task.tags.empty()) {
        record["tags"] = task.tags;
    }
    if (task.notes) {
        record["notes"] = *task.notes;
    }
    if (!task.subtasks.empty()) {
        nlohmann::json arr = nlohmann::json::array();
        arr.get_ref<nlohmann::json::array_t&>().reserve(task.subtasks.size());
        for (const Task& child : task.subtasks) {
            arr.push_back(task_to_json(child));
        }
        record["subtasks"] = std::move(arr);
    }
    if (!task.extra.is_null()) {
        record["extra"] = task.extra;
    }
    if (task.repeat) {
        record["repeat"] = task.repeat->rules;
    }
    return record;
}

Task task_from_json(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw StoreError("record is not a JSON object");
    }

    Task task;
    task.id = integer_field(required(record, "id"), "id");
    if (task.id <= 0) {
        malformed("id", "must be a positive integer");
    }
    task.name = string_field(required(record, "name"), "name");
    require_line_value(markdown::grammar::is_line_name(task.name), "name",
                       "must be a non-empty single line without an inner ']]'");
    task.status = parse_status(string_field(required(record, "status"), "status"));
    task.priority = string_field(required(record, "priority"), "priority");
    require_line_value(markdown::grammar::is_priority_token(task.priority), "priority",
                       "must be one token without whitespace or parentheses");
    task.created = date_field(required(record, "created"), "created");
    task.display_order = integer_field(required(record, "display_order"), "display_order");

    task.due = nullable_date(record, "due");
    task.updated = nullable_date(record, "updated");
    task.completed = nullable_date(record, "completed");

    if (const nlohmann::json* v = optional_field(record, "project")) {
        task.project = string_field(*v, "project");
        require_line_value(markdown::grammar::is_bare_token(*task.project), "project",
                           "must be non-empty without whitespace");
    }
    task.contexts = string_list(record, "contexts");
    require_tokens(task.contexts, "contexts");
    task.tags = string_list(record, "tags");
    require_tokens(task.tags, "tags");
    if (const nlohmann::json* v = optional_field(record, "notes")) {
        task.notes = string_field(*v, "notes");
        require_line_value(markdown::grammar::is_single_line(*task.notes), "notes", "must be a single line");
    }

    if (const nlohmann::json* v = optional_field(record, "subtasks")) {
        if (!v->is_array()) {
            malformed("subtasks", "must be an array of records");
        }
        for (const auto& child : *v) {
            try {
                task.subtasks.push_back(task_from_json(child));
            } catch (const StoreError& e) {
                throw StoreError(std::string("subtask of id ") + std::to_string(task.id) + ": " + e.what());
            }
        }
    }

    if (const nlohmann::json* v = optional_field(record, "extra")) {
        if (!v->is_object()) {
            malformed("extra", "must be an object");
        }
        task.extra = *v;
    }
    if (const nlohmann::json* v = optional_field(record, "repeat")) {
        if (!v->is_object()) {
            malformed("repeat", "must be an object");
        }
        task.repeat = RepeatRule{*v};
    }

    for (auto it = record.begin(); it != record.end(); ++it) {
        if (is_known_key(it.key())) continue;
        if (task.extra.is_null()) {
            task.extra = nlohmann::json::object();
        }
        if (!task.extra.contains(it.key())) {
            task.extra[it.key()] = it.value();
        }
        log::debug("[TaskStore] keeping unknown key '" + it.key() + "' of id " + std::to_string(task.id) + " under extra");
    }
    return task;
}

std::vector<Task> decode_records(const std::string& text) {
    std::vector<Task> tasks;
    const std::vector<std::string> lines = strings::split_lines(text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string line = strings::trim_copy(lines[i]);
        if (line.empty()) continue;
        const std::size_t line_number = i + 1;
        nlohmann::json record;
        try {
            record = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            throw StoreError("record on line " + std::to_string(line_number) + " is not valid JSON: " + e.what(), line_number);
        }
        try {
            tasks.push_back(task_from_json(record));
        } catch (const StoreError& e) {
            throw StoreError("record on line " + std::to_string(line_number) + ": " + e.what(), line_number);
        }
    }
    return tasks;
}

std::string encode_records(const std::vector<Task>& tasks) {
    std::string out;
    for (const Task& task : tasks) {
        try {
            out += task_to_json(task).dump();
        } catch (const nlohmann::json::type_error& e) {
            throw StoreError("record id " + std::to_string(task.id) + " cannot be encoded: " + e.what());
        }
        out += '\n';
    }
    return out;
}

TaskStore::TaskStore(std::filesystem::path path) : path_(std::move(path)) {}

bool TaskStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::vector<Task> TaskStore::load() const {
    if (!exists()) {
        log::info("[TaskStore] '" + path_.string() + "' does not exist yet; starting from an empty store");
        return {};
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw StoreError("Unable to open task store '" + path_.string() + "' for reading.");
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StoreError("Failed while reading task store '" + path_.string() + "'.");
    }
    std::vector<Task> tasks = decode_records(contents);
    log::debug("[TaskStore] loaded " + std::to_string(tasks.size()) + " record(s) from '" + path_.string() + "'");
    return tasks;
}

void TaskStore::save(const std::vector<Task>& tasks) const {
    const std::string payload = encode_records(tasks);

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("Failed to create parent directory for '" + path_.string() + "': " + ec.message());
        }
    }

    const std::filesystem::path tmp_full = path_.string() + ".tmp";
    {
        std::ofstream out(tmp_full, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("Failed to open temp file '" + tmp_full.string() + "' for writing");
        }
        out << payload;
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp_full, ec);
            throw StoreError("Stream error while writing temp '" + tmp_full.string() + "'");
        }
    }

    std::filesystem::rename(tmp_full, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp_full, ec);
        throw StoreError("rename('" + tmp_full.string() + "' -> '" + path_.string() + "') failed: " + reason);
    }
    log::debug("[TaskStore] wrote " + std::to_string(tasks.size()) + " record(s) to '" + path_.string() + "'");
}

}
