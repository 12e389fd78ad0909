#include "doctest/doctest.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "model/task.hpp"
#include "store/task_store.hpp"

namespace fs = std::filesystem;
using tasksync::Date;
using tasksync::Status;
using tasksync::StoreError;
using tasksync::Task;
using namespace tasksync::store;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT);
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

namespace {

nlohmann::json minimal_record(std::int64_t id) {
    return nlohmann::json{
        {"id", id},
        {"name", "Task " + std::to_string(id)},
        {"status", "none"},
        {"priority", "N"},
        {"created", "2024-01-02"},
        {"display_order", id},
        {"due", nullptr},
        {"updated", nullptr},
        {"completed", nullptr},
    };
}

std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}

TEST_CASE("nullable dates are always written, optionals only when present") {
    Task t;
    t.id = 4;
    t.name = "A";
    t.created = Date{2024, 1, 2};
    t.display_order = 1;

    const nlohmann::json record = task_to_json(t);
    REQUIRE(record.contains("due"));
    CHECK(record["due"].is_null());
    CHECK(record["updated"].is_null());
    CHECK(record["completed"].is_null());
    CHECK_FALSE(record.contains("project"));
    CHECK_FALSE(record.contains("contexts"));
    CHECK_FALSE(record.contains("tags"));
    CHECK_FALSE(record.contains("notes"));
    CHECK_FALSE(record.contains("subtasks"));
    CHECK_FALSE(record.contains("extra"));
    CHECK(record["status"] == "none");
    CHECK(record["created"] == "2024-01-02");

    t.notes = std::string();
    t.due = Date{2024, 5, 6};
    const nlohmann::json with_note = task_to_json(t);
    CHECK(with_note["notes"] == "");
    CHECK(with_note["due"] == "2024-05-06");
}

TEST_CASE("records decode with nested subtasks and extra") {
    nlohmann::json child = minimal_record(2);
    child["status"] = "done";
    nlohmann::json root = minimal_record(1);
    root["subtasks"] = nlohmann::json::array({child});
    root["tags"] = {"a", "b"};
    root["extra"] = {{"origin", "sync"}};
    root["repeat"] = nlohmann::json::object();

    const Task t = task_from_json(root);
    CHECK(t.id == 1);
    CHECK(t.tags == std::vector<std::string>{"a", "b"});
    CHECK(t.extra["origin"] == "sync");
    CHECK(t.repeat.has_value());
    REQUIRE(t.subtasks.size() == 1);
    CHECK(t.subtasks[0].status == Status::Done);

    CHECK(task_from_json(task_to_json(t)) == t);
}

TEST_CASE("unknown keys are kept under extra") {
    nlohmann::json record = minimal_record(1);
    record["color"] = "red";
    record["origin"] = "top-level";
    record["extra"] = {{"origin", "kept"}};

    const Task t = task_from_json(record);
    CHECK(t.extra["color"] == "red");
    CHECK(t.extra["origin"] == "kept");

    const nlohmann::json written = task_to_json(t);
    CHECK_FALSE(written.contains("color"));
    CHECK(written["extra"]["color"] == "red");
}

TEST_CASE("legacy status words decode") {
    nlohmann::json record = minimal_record(1);
    record["status"] = "open";
    CHECK(task_from_json(record).status == Status::None);
    record["status"] = "Doing";
    CHECK(task_from_json(record).status == Status::Doing);
    record["status"] = "archived";
    CHECK(task_from_json(record).status == Status::Unknown);
}

TEST_CASE("malformed records raise StoreError") {
    nlohmann::json missing_name = minimal_record(1);
    missing_name.erase("name");
    CHECK_THROWS_AS(task_from_json(missing_name), StoreError);

    nlohmann::json bad_date = minimal_record(1);
    bad_date["due"] = "31/12/2024";
    CHECK_THROWS_AS(task_from_json(bad_date), StoreError);

    nlohmann::json bad_id = minimal_record(1);
    bad_id["id"] = "one";
    CHECK_THROWS_AS(task_from_json(bad_id), StoreError);

    nlohmann::json bad_tags = minimal_record(1);
    bad_tags["tags"] = "a";
    CHECK_THROWS_AS(task_from_json(bad_tags), StoreError);

    CHECK_THROWS_AS(task_from_json(nlohmann::json::array()), StoreError);
}

TEST_CASE("nullable date keys may be missing on read") {
    nlohmann::json record = minimal_record(1);
    record.erase("due");
    record.erase("updated");
    const Task t = task_from_json(record);
    CHECK_FALSE(t.due.has_value());
    CHECK_FALSE(t.updated.has_value());
}

TEST_CASE("decode reports the failing line") {
    const std::string text =
        minimal_record(1).dump() + "\n" +
        "\n" +
        "{not json\n";
    try {
        decode_records(text);
        FAIL("expected StoreError");
    } catch (const StoreError& e) {
        CHECK(e.record_line() == 3);
    }

    const std::string ok = minimal_record(1).dump() + "\n\n" + minimal_record(2).dump() + "\n";
    const auto tasks = decode_records(ok);
    REQUIRE(tasks.size() == 2);
    CHECK(tasks[1].id == 2);
}

TEST_CASE("encode writes one record per line") {
    const auto tasks = decode_records(minimal_record(1).dump() + "\n" + minimal_record(2).dump() + "\n");
    const std::string text = encode_records(tasks);
    CHECK(std::count(text.begin(), text.end(), '\n') == 2);
    CHECK(text.back() == '\n');
    CHECK(decode_records(text) == tasks);
}

TEST_CASE("task store round trips through disk") {
    const fs::path root = test_root() / "task_store";
    std::error_code ec;
    fs::remove_all(root, ec);

    const TaskStore store(root / "nested" / "tasks.jsonl");
    CHECK_FALSE(store.exists());
    CHECK(store.load().empty());

    auto tasks = decode_records(minimal_record(1).dump() + "\n" + minimal_record(2).dump() + "\n");
    tasks[0].extra = nlohmann::json{{"keep", true}};
    store.save(tasks);

    CHECK(store.exists());
    CHECK_FALSE(fs::exists(root / "nested" / "tasks.jsonl.tmp"));
    CHECK(store.load() == tasks);
    CHECK(read_all(store.path()) == encode_records(tasks));
}

TEST_CASE("corrupt store file fails the whole load") {
    const fs::path root = test_root() / "task_store_corrupt";
    std::error_code ec;
    fs::create_directories(root, ec);
    const fs::path file = root / "tasks.jsonl";
    {
        std::ofstream out(file, std::ios::trunc);
        REQUIRE(out.is_open());
        out << minimal_record(1).dump() << "\n" << "[1,2,3]\n";
    }
    CHECK_THROWS_AS(TaskStore(file).load(), StoreError);
}

TEST_CASE("values the markdown line cannot carry are refused on load") {
    auto refused = [](const char* key, const nlohmann::json& value) {
        nlohmann::json record = minimal_record(1);
        record[key] = value;
        CHECK_THROWS_AS(task_from_json(record), StoreError);
    };
    refused("name", "");
    refused("name", "a]] b");
    refused("name", "two\nlines");
    refused("priority", "very high");
    refused("priority", "(A)");
    refused("priority", "");
    refused("notes", "line one\nline two");
    refused("project", "two words");
    refused("contexts", nlohmann::json::array({"ok", ""}));
    refused("tags", nlohmann::json::array({"has space"}));

    nlohmann::json child = minimal_record(2);
    child["name"] = "bad]] child";
    nlohmann::json root = minimal_record(1);
    root["subtasks"] = nlohmann::json::array({child});
    CHECK_THROWS_AS(task_from_json(root), StoreError);

    nlohmann::json fine = minimal_record(1);
    fine["name"] = "see [x]";
    fine["priority"] = "high";
    fine["notes"] = "say \"hi\"";
    CHECK(task_from_json(fine).name == "see [x]");
}

TEST_CASE("invalid utf-8 is refused instead of rewritten") {
    Task t;
    t.id = 1;
    t.name = std::string("bad \xff name");
    t.created = Date{2024, 1, 2};
    CHECK_THROWS_AS(encode_records({t}), StoreError);

    const fs::path root = test_root() / "task_store_utf8";
    std::error_code ec;
    fs::remove_all(root, ec);
    const TaskStore store(root / "tasks.jsonl");
    store.save(decode_records(minimal_record(1).dump() + "\n"));
    const std::string before = read_all(store.path());

    CHECK_THROWS_AS(store.save({t}), StoreError);
    CHECK(read_all(store.path()) == before);
    CHECK_FALSE(fs::exists(root / "tasks.jsonl.tmp"));
}
