#include <catch2/catch_test_macros.hpp>
#include "support.hpp"

using namespace fieldsync;
using namespace fieldsync::test;
using nlohmann::json;

TEST_CASE("Task status names", "[task]") {
    for (auto status : all_statuses) {
        REQUIRE(parse_status(to_string(status)) == status);
    }
    REQUIRE(to_string(TaskStatus::InProgress) == "IN_PROGRESS");
    REQUIRE(!parse_status("DONE"));
    REQUIRE(!parse_status("in_progress"));
}

TEST_CASE("Transition table", "[task]") {
    REQUIRE(can_transition(TaskStatus::Planned, TaskStatus::InProgress));
    REQUIRE(can_transition(TaskStatus::InProgress, TaskStatus::Paused));
    REQUIRE(can_transition(TaskStatus::Paused, TaskStatus::InProgress));
    REQUIRE(!can_transition(TaskStatus::Planned, TaskStatus::Completed));
    REQUIRE(!can_transition(TaskStatus::Paused, TaskStatus::Completed));
    REQUIRE(is_terminal(TaskStatus::Completed));
    REQUIRE(is_terminal(TaskStatus::Cancelled));
    REQUIRE(!is_terminal(TaskStatus::Paused));

    static_assert(can_transition(TaskStatus::InProgress, TaskStatus::Completed));
    static_assert(allowed_transitions(TaskStatus::Completed).empty());
}

TEST_CASE("Task snapshot", "[task]") {
    auto task = make_task("t1", TaskStatus::InProgress);

    SECTION("optional fields are omitted when unset") {
        auto snap = task.snapshot();
        REQUIRE(snap["status"] == "IN_PROGRESS");
        REQUIRE(snap["name"] == "Irrigate north field");
        REQUIRE(!snap.contains("progress"));
        REQUIRE(!snap.contains("notes"));
        REQUIRE(!snap.contains("type"));
    }

    SECTION("set fields are included") {
        task.progress = 30;
        task.notes = "Pump pressure low";
        task.type = "IRRIGATION";
        auto snap = task.snapshot();
        REQUIRE(snap["progress"] == 30);
        REQUIRE(snap["notes"] == "Pump pressure low");
        REQUIRE(snap["type"] == "IRRIGATION");
    }
}

TEST_CASE("Task JSON mapping", "[task]") {
    auto task = make_task("t1", TaskStatus::Paused, {"alice", "bob"});
    task.progress = 55;
    task.priority = Priority::High;
    task.metadata.set(meta::pause_reason, "rain");
    task.field_stamps["status"] = at_seconds(900);

    auto j = task.to_json();
    REQUIRE(j["status"] == "PAUSED");
    REQUIRE(j["priority"] == "HIGH");
    REQUIRE(j["assignments"].size() == 2);
    REQUIRE(j["updatedAt"] == to_iso8601(at_seconds(1000)));

    auto back = Task::from_json(j);
    REQUIRE(back.has_value());
    REQUIRE(back->status == TaskStatus::Paused);
    REQUIRE(back->progress == 55);
    REQUIRE(back->assignments[1].actor_id == "bob");
    REQUIRE(back->assignments[1].role == AssignmentRole::Support);
    REQUIRE(back->metadata.get_string(meta::pause_reason) == "rain");
    REQUIRE(back->field_stamps.at("status") == at_seconds(900));
    REQUIRE(back->updated_at == at_seconds(1000));
}

TEST_CASE("Task from JSON rejects invalid input", "[task]") {
    REQUIRE(Task::from_json(json::array()).error().is_validation());
    REQUIRE(Task::from_json(json{{"name", "no id"}}).error().is_validation());
    REQUIRE(Task::from_json(json{{"id", "t1"}, {"status", "DONE"}}).error().is_validation());
    REQUIRE(Task::from_json(json{{"id", "t1"}, {"priority", "MEDIUM"}}).error().is_validation());
}

TEST_CASE("Task from JSON reports wrongly typed fields as validation errors", "[task]") {
    auto rejects = [](json j) {
        if (!j.contains("id")) j["id"] = "t1";
        auto parsed = Task::from_json(j);
        return !parsed && parsed.error().is_validation();
    };

    REQUIRE(rejects(json{{"id", 7}}));
    REQUIRE(rejects(json{{"status", 3}}));
    REQUIRE(rejects(json{{"priority", json::array()}}));
    REQUIRE(rejects(json{{"name", false}}));
    REQUIRE(rejects(json{{"progress", "half"}}));
    REQUIRE(rejects(json{{"progress", 42.5}}));
    REQUIRE(rejects(json{{"progress", 1e20}}));
    REQUIRE(rejects(json{{"progress", 101}}));
    REQUIRE(rejects(json{{"progress", 18446744073709551615ull}}));
    REQUIRE(rejects(json{{"notes", 12}}));
    REQUIRE(rejects(json{{"updatedAt", "last tuesday"}}));
    REQUIRE(rejects(json{{"updatedAt", 1700000000}}));
    REQUIRE(rejects(json{{"assignments", "alice"}}));
    REQUIRE(rejects(json{{"assignments", json::array({42})}}));
    REQUIRE(rejects(json{{"assignments", json::array({json{{"actorId", "alice"}, {"role", "BOSS"}}})}}));
    REQUIRE(rejects(json{{"assignments", json::array({json{{"actorId", "alice"}, {"active", "yes"}}})}}));

    SECTION("nulls read as unset") {
        auto parsed = Task::from_json(json{{"id", "t1"}, {"progress", nullptr}, {"notes", nullptr},
                                           {"status", nullptr}, {"scheduledAt", nullptr}});
        REQUIRE(parsed.has_value());
        REQUIRE(!parsed->progress.has_value());
        REQUIRE(parsed->status == TaskStatus::Planned);
        REQUIRE(!parsed->scheduled_at.has_value());
    }
}

TEST_CASE("Submissions and actors tolerate wrongly typed fields", "[task]") {
    auto submission = NoteSubmission::from_json(json{{"taskId", 5}, {"content", "ok"}, {"isPrivate", "no"}});
    REQUIRE(submission.task_id.empty());
    REQUIRE(submission.content == "ok");
    REQUIRE(!submission.is_private);

    REQUIRE(NoteSubmission::from_json(json::array()).content.empty());
    REQUIRE(Actor::from_json(json{{"id", 1}, {"organizationId", "org-1"}}).id.empty());
    REQUIRE(Actor::from_json(json("alice")).organization_id.empty());
}

TEST_CASE("Changed fields are stamped", "[task]") {
    auto before = make_task("t1", TaskStatus::Planned);
    auto after = before;
    after.status = TaskStatus::InProgress;
    after.progress = 10;

    stamp_changed_fields(before, after, at_seconds(2000));
    REQUIRE(after.field_stamps.at("status") == at_seconds(2000));
    REQUIRE(after.field_stamps.at("progress") == at_seconds(2000));
    REQUIRE(after.field_stamps.count("name") == 0);
    REQUIRE(after.field_stamps.count("metadata") == 0);
}
