#include "doctest/doctest.h"

#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "markdown/hierarchy_builder.hpp"
#include "merge/merge_engine.hpp"
#include "model/task.hpp"

using tasksync::Date;
using tasksync::RepeatRule;
using tasksync::Status;
using tasksync::Task;
using tasksync::markdown::ParseContext;
using tasksync::markdown::parse_document;
using tasksync::merge::MergeEngine;
using tasksync::merge::merge_tasks;

namespace {

const Date kToday{2024, 3, 15};

Task stored(std::int64_t id, const std::string& name, std::int64_t order) {
    Task t;
    t.id = id;
    t.name = name;
    t.created = Date{2023, 1, 1};
    t.display_order = order;
    return t;
}

std::vector<Task> edited(const std::string& doc) {
    return parse_document(doc, ParseContext::for_date(kToday));
}

}

TEST_CASE("matched record takes the edit and keeps id, created and extra") {
    Task old = stored(1, "Old", 1);
    old.due = Date{2023, 12, 31};
    old.project = "X";
    old.contexts = {"home"};
    old.notes = std::string("n");
    old.extra = nlohmann::json{{"source", "import"}, {"weight", 3}};

    const auto result = merge_tasks({old}, edited("- [ ] [[New]] id:1\n"), kToday);

    REQUIRE(result.tasks.size() == 1);
    const Task& t = result.tasks[0];
    CHECK(t.id == 1);
    CHECK(t.name == "New");
    CHECK_FALSE(t.due.has_value());
    CHECK_FALSE(t.project.has_value());
    CHECK(t.contexts.empty());
    CHECK_FALSE(t.notes.has_value());
    REQUIRE(t.updated.has_value());
    CHECK(*t.updated == kToday);
    CHECK(t.created == Date{2023, 1, 1});
    CHECK(t.extra == old.extra);
    CHECK(result.updated == std::vector<std::int64_t>{1});
    CHECK(result.added.empty());
    CHECK(result.deleted.empty());
}

TEST_CASE("typed updated value is replaced by the processing date") {
    const auto result = merge_tasks({stored(1, "A", 1)}, edited("- [x] [[A]] id:1 updated:2020-01-01\n"), kToday);
    REQUIRE(result.tasks.size() == 1);
    CHECK(*result.tasks[0].updated == kToday);
    CHECK(result.tasks[0].status == Status::Done);
}

TEST_CASE("unmatched stored records are deleted") {
    const std::vector<Task> previous = {stored(1, "A", 1), stored(2, "B", 2), stored(3, "C", 3)};
    const auto result = merge_tasks(previous, edited("- [ ] [[C]] id:3\n- [ ] [[A]] id:1\n"), kToday);

    REQUIRE(result.tasks.size() == 2);
    CHECK(result.tasks[0].id == 3);
    CHECK(result.tasks[0].display_order == 1);
    CHECK(result.tasks[1].id == 1);
    CHECK(result.tasks[1].display_order == 2);
    CHECK(result.deleted == std::vector<std::int64_t>{2});
    CHECK(result.updated == std::vector<std::int64_t>{3, 1});
}

TEST_CASE("new ids become records stamped with today") {
    const auto result = merge_tasks({stored(1, "A", 1)}, edited("- [ ] [[A]] id:1\n- [ ] [[Fresh]]\n"), kToday);
    REQUIRE(result.tasks.size() == 2);
    const Task& fresh = result.tasks[1];
    CHECK(fresh.name == "Fresh");
    CHECK(fresh.id == 2);
    CHECK(fresh.created == kToday);
    CHECK(*fresh.updated == kToday);
    CHECK(fresh.extra.is_null());
    CHECK(result.added == std::vector<std::int64_t>{2});
}

TEST_CASE("empty store adds the whole forest") {
    const auto result = merge_tasks({}, edited("- [ ] [[A]]\n    - [x] [[B]]\n"), kToday);
    REQUIRE(result.tasks.size() == 1);
    CHECK(result.tasks[0].id == 1);
    REQUIRE(result.tasks[0].subtasks.size() == 1);
    CHECK(result.tasks[0].subtasks[0].id == 2);
    CHECK(result.added == std::vector<std::int64_t>{1});
}

TEST_CASE("output order is dense whatever the incoming orders") {
    std::vector<Task> incoming = {stored(1, "A", 10), stored(2, "B", 3), stored(3, "C", 7), stored(4, "D", 3)};
    const auto result = MergeEngine(kToday).merge({}, incoming);

    REQUIRE(result.tasks.size() == 4);
    CHECK(result.tasks[0].id == 2);
    CHECK(result.tasks[1].id == 4);
    CHECK(result.tasks[2].id == 3);
    CHECK(result.tasks[3].id == 1);
    for (std::size_t i = 0; i < result.tasks.size(); ++i) {
        CHECK(result.tasks[i].display_order == static_cast<std::int64_t>(i + 1));
    }
}

TEST_CASE("repeat rules are carried over like extra") {
    Task old = stored(1, "A", 1);
    old.repeat = RepeatRule{nlohmann::json{{"every", "week"}}};
    const auto result = merge_tasks({old}, edited("- [ ] [[A]] id:1\n"), kToday);
    REQUIRE(result.tasks[0].repeat.has_value());
    CHECK(result.tasks[0].repeat->rules["every"] == "week");
}

TEST_CASE("subtask trees are replaced verbatim") {
    Task child = stored(9, "Child", 2);
    child.extra = nlohmann::json{{"k", 1}};
    child.project = "old";
    Task parent = stored(1, "Parent", 1);
    parent.subtasks.push_back(child);

    const auto result = merge_tasks({parent}, edited("- [ ] [[Parent]] id:1\n    - [ ] [[Child renamed]] id:9\n"), kToday);
    REQUIRE(result.tasks.size() == 1);
    REQUIRE(result.tasks[0].subtasks.size() == 1);
    const Task& sub = result.tasks[0].subtasks[0];
    CHECK(sub.name == "Child renamed");
    CHECK(sub.extra.is_null());
    CHECK_FALSE(sub.project.has_value());
    CHECK(sub.created == kToday);
}

TEST_CASE("repeated id in the edit matches once and adds the rest") {
    const auto result = merge_tasks({stored(5, "A", 1)}, edited("- [ ] [[A]] id:5\n- [ ] [[A copy]] id:5\n"), kToday);
    REQUIRE(result.tasks.size() == 2);
    CHECK(result.updated == std::vector<std::int64_t>{5});
    CHECK(result.added == std::vector<std::int64_t>{5});
    CHECK(result.tasks[0].created == Date{2023, 1, 1});
    CHECK(result.tasks[1].name == "A copy");
}

TEST_CASE("merged size equals the edited root count") {
    const std::vector<Task> previous = {stored(1, "A", 1), stored(2, "B", 2)};
    const auto result = merge_tasks(previous, edited("- [ ] [[X]] id:10\n- [ ] [[Y]] id:11\n- [ ] [[Z]] id:12\n- [ ] [[B]] id:2\n"), kToday);
    CHECK(result.tasks.size() == 4);
    std::set<std::int64_t> ids;
    for (const Task& t : result.tasks) ids.insert(t.id);
    CHECK(ids.size() == 4);
    CHECK(ids.count(1) == 0);
    CHECK(result.deleted == std::vector<std::int64_t>{1});
}
