#include <catch2/catch_test_macros.hpp>
#include "support.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fieldsync;
using namespace fieldsync::test;
using nlohmann::json;

namespace {

class ThrowingBroadcaster : public UpdateBroadcaster {
public:
    int calls = 0;
    void task_updated(const Task&) override {
        ++calls;
        throw std::runtime_error("socket closed");
    }
    void note_added(const Note&) override {
        ++calls;
        throw std::runtime_error("socket closed");
    }
};

class ExplodingRepository : public MemoryRepository {
public:
    std::optional<Task> load_task(const std::string& id) const override {
        if (id == "boom") {
            throw std::runtime_error("disk on fire");
        }
        return MemoryRepository::load_task(id);
    }
};

// Lets another writer in between the orchestrator's load and its save
class RacingRepository : public MemoryRepository {
    bool raced_ = false;

public:
    expected<Task, Error> save_task(const Task& task, Timestamp expected_watermark) override {
        if (!raced_) {
            raced_ = true;
            auto other = *MemoryRepository::load_task(task.id);
            other.description = "written by another device";
            auto interleaved = MemoryRepository::save_task(other, other.updated_at);
            REQUIRE(interleaved.has_value());
        }
        return MemoryRepository::save_task(task, expected_watermark);
    }
};

TaskUpdate update(std::string id, json fields) {
    return TaskUpdate{std::move(id), std::move(fields)};
}

NoteSubmission note(std::string task_id, std::string content) {
    NoteSubmission n;
    n.task_id = std::move(task_id);
    n.content = std::move(content);
    n.type = NoteType::Observation;
    return n;
}

struct Fixture {
    MetricsRegistry registry;
    MemoryRepository repo;
    TaskLocks locks;
    MemoryBroadcaster broadcaster;

    SyncOrchestrator orchestrator(SyncOptions options = {}) {
        options.metrics = &registry;
        return SyncOrchestrator(repo, locks, broadcaster,
                                ConflictResolver(std::make_shared<CriticalFieldsPolicy>(),
                                                 fixed_clock(at_seconds(5000))),
                                options);
    }
};

} // namespace

TEST_CASE("One missing task does not stop the batch", "[sync][scenario]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress));
    f.repo.put_task(make_task("t2", TaskStatus::InProgress));

    auto result = f.orchestrator().sync_batch(
        {update("t1", {{"progress", 20}}),
         update("missing", {{"progress", 30}}),
         update("t2", {{"progress", 40}})},
        {}, at_seconds(1000), worker());

    REQUIRE(result.tasks_updated == 2);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].item_id == "missing");
    REQUIRE(result.errors[0].code == Errc::NotFound);
    REQUIRE(result.errors[0].kind == ItemKind::Update);

    REQUIRE(f.repo.load_task("t1")->progress == 20);
    REQUIRE(f.repo.load_task("t2")->progress == 40);
    REQUIRE(f.locks.size() == 0);
    REQUIRE(f.registry.counter("fieldsync_sync_items_total")->value() == 3);
    REQUIRE(f.registry.counter("fieldsync_sync_errors_total")->value() == 1);

    auto j = result.to_json();
    REQUIRE(j["tasksUpdated"] == 2);
    REQUIRE(j["errors"][0]["id"] == "missing");
    REQUIRE(j["errors"][0]["code"] == "NOT_FOUND");
}

TEST_CASE("Duplicate notes in one batch are stored once", "[sync][scenario]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress));

    auto result = f.orchestrator().sync_batch(
        {},
        {note("t1", "Aphids on row 12"), note("t1", "Aphids on row 12")},
        at_seconds(1000), worker());

    REQUIRE(result.notes_added == 1);
    REQUIRE(result.notes_skipped == 1);
    REQUIRE(result.errors.empty());
    REQUIRE(f.repo.notes_for("t1").size() == 1);
    REQUIRE(f.registry.counter("fieldsync_notes_deduplicated_total")->value() == 1);

    SECTION("a retried submission with the same lastSync is skipped too") {
        auto retry = f.orchestrator().sync_batch({}, {note("t1", "Aphids on row 12")},
                                                 at_seconds(1000), worker());
        REQUIRE(retry.notes_added == 0);
        REQUIRE(retry.notes_skipped == 1);
        REQUIRE(f.repo.notes_for("t1").size() == 1);
    }

    SECTION("a different author is not a duplicate") {
        auto task = *f.repo.load_task("t1");
        REQUIRE(AssignmentRegistry().assign(task, {"alice", "bob"}, worker("manager")).has_value());
        f.repo.put_task(task);

        auto other = f.orchestrator().sync_batch({}, {note("t1", "Aphids on row 12")},
                                                 at_seconds(1000), worker("bob"));
        REQUIRE(other.notes_added == 1);
    }
}

TEST_CASE("Note rejections", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress, {"alice"}));

    auto result = f.orchestrator().sync_batch(
        {},
        {note("ghost", "x"), note("t1", ""), note("t1", "ok")},
        at_seconds(1000), worker());
    REQUIRE(result.notes_added == 1);
    REQUIRE(result.errors.size() == 2);
    REQUIRE(result.errors[0].code == Errc::NotFound);
    REQUIRE(result.errors[1].code == Errc::Validation);
    REQUIRE(result.errors[0].kind == ItemKind::Note);

    auto outsider = f.orchestrator().sync_batch({}, {note("t1", "hi")}, at_seconds(1000), worker("bob"));
    REQUIRE(outsider.errors[0].code == Errc::Forbidden);

    auto creator = f.orchestrator().sync_batch({}, {note("t1", "hi")}, at_seconds(1000), worker("manager"));
    REQUIRE(creator.notes_added == 1);
}

TEST_CASE("Conflicting status keeps the server value and applies progress", "[sync][scenario]") {
    Fixture f;
    auto task = make_task("t1", TaskStatus::InProgress, {"alice"}, at_seconds(1000));
    task.progress = 40;
    task.field_stamps["status"] = at_seconds(1000);
    task.field_stamps["progress"] = at_seconds(100);
    f.repo.put_task(task);

    auto result = f.orchestrator().sync_batch(
        {update("t1", {{"status", "COMPLETED"}, {"progress", 80}})},
        {}, at_seconds(500), worker());

    REQUIRE(result.tasks_updated == 1);
    REQUIRE(result.conflicts_resolved == 1);

    auto stored = *f.repo.load_task("t1");
    REQUIRE(stored.status == TaskStatus::InProgress);
    REQUIRE(stored.progress == 80);
    REQUIRE(stored.metadata.has(meta::conflict_resolution));
    REQUIRE(stored.metadata.get_string(meta::synced_by) == "alice");
    REQUIRE(stored.metadata.has(meta::synced_at));

    SECTION("an audit note is written") {
        auto notes = f.repo.notes_for("t1");
        REQUIRE(notes.size() == 1);
        REQUIRE(notes[0].content == "Conflict resolution applied: 1 conflicts resolved using MERGE strategy");
    }

    SECTION("re-syncing with the returned watermark finds no conflicts") {
        json payload = {{"status", "COMPLETED"}, {"progress", 80}};
        REQUIRE(detect_conflicts(ServerSnapshot::of(stored), payload, result.synced_at).empty());

        // With the conflict acknowledged the client's edit is its own
        auto again = f.orchestrator().sync_batch({update("t1", payload)}, {}, result.synced_at, worker());
        REQUIRE(again.conflicts_resolved == 0);
        REQUIRE(again.errors.empty());
        REQUIRE(f.repo.load_task("t1")->status == TaskStatus::Completed);
    }
}

TEST_CASE("Audit notes can be disabled", "[sync]") {
    Fixture f;
    auto task = make_task("t1", TaskStatus::InProgress, {"alice"}, at_seconds(1000));
    f.repo.put_task(task);

    SyncOptions options;
    options.audit_conflicts = false;
    auto result = f.orchestrator(options).sync_batch(
        {update("t1", {{"notes", "client notes"}})}, {}, at_seconds(500), worker());

    REQUIRE(result.conflicts_resolved == 1);
    REQUIRE(f.repo.notes_for("t1").empty());
    REQUIRE(f.repo.load_task("t1")->notes == "client notes");
}

TEST_CASE("Status changes go through the lifecycle", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("planned", TaskStatus::Planned));
    f.repo.put_task(make_task("done", TaskStatus::Completed));
    f.repo.put_task(make_task("other", TaskStatus::Planned));

    auto result = f.orchestrator().sync_batch(
        {update("planned", {{"status", "IN_PROGRESS"}}),
         update("done", {{"status", "IN_PROGRESS"}}),
         update("other", {{"status", "BOGUS"}})},
        {}, at_seconds(1000), worker());

    REQUIRE(result.tasks_updated == 1);
    REQUIRE(result.errors.size() == 2);
    REQUIRE(result.errors[0].item_id == "done");
    REQUIRE(result.errors[0].code == Errc::InvalidState);
    REQUIRE(result.errors[1].item_id == "other");
    REQUIRE(result.errors[1].code == Errc::Validation);

    auto started = *f.repo.load_task("planned");
    REQUIRE(started.status == TaskStatus::InProgress);
    REQUIRE(started.metadata.has(meta::started_at));
    REQUIRE(f.repo.load_task("done")->status == TaskStatus::Completed);
}

TEST_CASE("Rejected task updates", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress, {"alice"}));

    SECTION("actor is not assigned") {
        auto result = f.orchestrator().sync_batch({update("t1", {{"progress", 10}})}, {},
                                                  at_seconds(1000), worker("bob"));
        REQUIRE(result.errors[0].code == Errc::Forbidden);
    }

    SECTION("creator may cancel offline") {
        auto result = f.orchestrator().sync_batch({update("t1", {{"status", "CANCELLED"}})}, {},
                                                  at_seconds(1000), worker("manager"));
        REQUIRE(result.errors.empty());
        REQUIRE(f.repo.load_task("t1")->status == TaskStatus::Cancelled);
    }

    SECTION("progress out of range") {
        auto result = f.orchestrator().sync_batch({update("t1", {{"progress", 150}})}, {},
                                                  at_seconds(1000), worker());
        REQUIRE(result.errors[0].code == Errc::Validation);
        REQUIRE(!f.repo.load_task("t1")->progress.has_value());
    }

    SECTION("missing task id") {
        auto result = f.orchestrator().sync_batch({update("", {{"progress", 10}})}, {},
                                                  at_seconds(1000), worker());
        REQUIRE(result.errors[0].code == Errc::Validation);
    }
}

TEST_CASE("Metadata from the client merges additively", "[sync]") {
    Fixture f;
    auto task = make_task("t1", TaskStatus::InProgress);
    task.metadata.stamp(meta::started_at, at_seconds(900));
    f.repo.put_task(task);

    auto result = f.orchestrator().sync_batch(
        {update("t1", {{"metadata", {{"location", {{"lat", -1.28}, {"lng", 36.8}}}}}})},
        {}, at_seconds(1000), worker());
    REQUIRE(result.errors.empty());

    auto stored = *f.repo.load_task("t1");
    REQUIRE(stored.metadata.get_string(meta::started_at) == to_iso8601(at_seconds(900)));
    REQUIRE((*stored.metadata.get(meta::location))["lat"] == -1.28);
}

TEST_CASE("Concurrent writer produces a stale write", "[sync]") {
    MetricsRegistry registry;
    RacingRepository repo;
    TaskLocks locks;
    NullBroadcaster broadcaster;
    repo.put_task(make_task("t1", TaskStatus::InProgress));

    SyncOptions options;
    options.metrics = &registry;
    SyncOrchestrator orchestrator(repo, locks, broadcaster, ConflictResolver(), options);

    auto result = orchestrator.sync_batch({update("t1", {{"progress", 10}})}, {},
                                          at_seconds(1000), worker());
    REQUIRE(result.tasks_updated == 0);
    REQUIRE(result.errors[0].code == Errc::StaleWrite);
    REQUIRE(repo.load_task("t1")->description == "written by another device");
}

TEST_CASE("Unexpected exceptions fail only their item", "[sync]") {
    MetricsRegistry registry;
    ExplodingRepository repo;
    TaskLocks locks;
    NullBroadcaster broadcaster;
    repo.put_task(make_task("t1", TaskStatus::InProgress));

    SyncOptions options;
    options.metrics = &registry;
    SyncOrchestrator orchestrator(repo, locks, broadcaster, ConflictResolver(), options);

    auto result = orchestrator.sync_batch(
        {update("boom", {{"progress", 10}}), update("t1", {{"progress", 20}})},
        {}, at_seconds(1000), worker());

    REQUIRE(result.tasks_updated == 1);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].item_id == "boom");
    REQUIRE(result.errors[0].code == Errc::Internal);
    REQUIRE(result.errors[0].message == "disk on fire");
}

TEST_CASE("Broadcast failures never fail the sync", "[sync]") {
    MetricsRegistry registry;
    MemoryRepository repo;
    TaskLocks locks;
    ThrowingBroadcaster broadcaster;
    repo.put_task(make_task("t1", TaskStatus::InProgress));

    SyncOptions options;
    options.metrics = &registry;
    SyncOrchestrator orchestrator(repo, locks, broadcaster, ConflictResolver(), options);

    auto result = orchestrator.sync_batch({update("t1", {{"progress", 10}})},
                                          {note("t1", "done with row 3")},
                                          at_seconds(1000), worker());
    REQUIRE(result.tasks_updated == 1);
    REQUIRE(result.notes_added == 1);
    REQUIRE(result.errors.empty());
    REQUIRE(broadcaster.calls == 2);
}

TEST_CASE("Subscribers receive merged state", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress));
    int id = f.broadcaster.subscribe();

    f.orchestrator().sync_batch({update("t1", {{"progress", 10}})}, {}, at_seconds(1000), worker());

    auto message = f.broadcaster.pop_message(id);
    REQUIRE(message.has_value());
    auto j = json::parse(*message);
    REQUIRE(j["type"] == "task_updated");
    REQUIRE(j["data"]["progress"] == 10);
    REQUIRE(!f.broadcaster.pop_message(id).has_value());
}

TEST_CASE("Parallel workers", "[sync]") {
    Fixture f;
    std::vector<TaskUpdate> updates;
    for (int i = 0; i < 16; ++i) {
        auto id = "t" + std::to_string(i);
        f.repo.put_task(make_task(id, TaskStatus::InProgress));
        updates.push_back(update(id, {{"progress", i}}));
    }
    // Several updates to one task apply in submission order
    for (int p = 10; p <= 50; p += 10) {
        updates.push_back(update("t0", {{"progress", p}}));
    }

    SyncOptions options;
    options.workers = 4;
    auto result = f.orchestrator(options).sync_batch(updates, {}, at_seconds(1000), worker());

    REQUIRE(result.errors.empty());
    REQUIRE(result.tasks_updated == updates.size());
    REQUIRE(f.repo.load_task("t0")->progress == 50);
    for (int i = 1; i < 16; ++i) {
        REQUIRE(f.repo.load_task("t" + std::to_string(i))->progress == i);
    }
}

TEST_CASE("Offline package", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("planned", TaskStatus::Planned, {"alice"}));
    f.repo.put_task(make_task("paused", TaskStatus::Paused, {"alice"}));
    f.repo.put_task(make_task("done", TaskStatus::Completed, {"alice"}));
    f.repo.put_task(make_task("bobs", TaskStatus::InProgress, {"bob"}));
    auto foreign = make_task("foreign", TaskStatus::Planned, {"alice"});
    foreign.organization_id = "org-2";
    f.repo.put_task(foreign);

    auto package = f.orchestrator().offline_package(worker());
    REQUIRE(package.tasks.size() == 2);
    REQUIRE(package.tasks[0].id == "paused");
    REQUIRE(package.tasks[1].id == "planned");
    REQUIRE(package.last_sync == f.repo.current_watermark());
    REQUIRE(package.to_json()["totalTasks"] == 2);
}

TEST_CASE("Task update JSON", "[sync]") {
    auto u = TaskUpdate::from_json(json{{"taskId", "t9"}, {"status", "PAUSED"}, {"metadata", {{"pauseReason", "rain"}}}});
    REQUIRE(u.task_id == "t9");
    REQUIRE(!u.fields.contains("taskId"));
    REQUIRE(u.fields["status"] == "PAUSED");
    REQUIRE(u.fields["metadata"]["pauseReason"] == "rain");
}

TEST_CASE("Later updates to one task are not compared with the batch's own writes", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress));

    // Paused and resumed while offline
    auto result = f.orchestrator().sync_batch(
        {update("t1", {{"status", "PAUSED"}, {"metadata", {{"pauseReason", "rain"}}}}),
         update("t1", {{"status", "IN_PROGRESS"}})},
        {}, at_seconds(1000), worker());

    REQUIRE(result.errors.empty());
    REQUIRE(result.tasks_updated == 2);
    REQUIRE(result.conflicts_resolved == 0);

    auto stored = *f.repo.load_task("t1");
    REQUIRE(stored.status == TaskStatus::InProgress);
    REQUIRE(stored.metadata.has(meta::paused_at));
    REQUIRE(stored.metadata.has(meta::resumed_at));
    REQUIRE(stored.metadata.get_string(meta::pause_reason) == "rain");
    REQUIRE(f.repo.notes_for("t1").empty());

    SECTION("a server change the client never saw still conflicts") {
        auto task = make_task("t2", TaskStatus::InProgress, {"alice"}, at_seconds(1500));
        task.progress = 70;
        task.field_stamps["status"] = at_seconds(900);
        task.field_stamps["progress"] = at_seconds(1500);
        f.repo.put_task(task);

        auto second = f.orchestrator().sync_batch(
            {update("t2", {{"status", "PAUSED"}}),
             update("t2", {{"status", "IN_PROGRESS"}, {"progress", 20}})},
            {}, at_seconds(1000), worker());

        REQUIRE(second.errors.empty());
        REQUIRE(second.conflicts_resolved == 1);
        auto merged = *f.repo.load_task("t2");
        REQUIRE(merged.status == TaskStatus::InProgress);
        REQUIRE(merged.progress == 20);
        REQUIRE(f.repo.notes_for("t2").size() == 1);
    }
}

TEST_CASE("Resubmitted notes are skipped when the watermark is ahead of the clock", "[sync]") {
    auto frozen = fixed_clock(at_seconds(5000));
    MemoryRepository repo(frozen);
    TaskLocks locks;
    NullBroadcaster broadcaster;
    MetricsRegistry registry;
    SyncOptions options;
    options.metrics = &registry;
    SyncOrchestrator orchestrator(repo, locks, broadcaster, ConflictResolver(nullptr, frozen),
                                  options, frozen);
    repo.put_task(make_task("t1", TaskStatus::InProgress));

    // Three saves within one clock tick push the watermark past the clock
    auto first = orchestrator.sync_batch(
        {update("t1", {{"progress", 10}}), update("t1", {{"progress", 20}}),
         update("t1", {{"progress", 30}})},
        {}, at_seconds(1000), worker());
    REQUIRE(first.errors.empty());
    REQUIRE(first.synced_at > at_seconds(5000));

    auto second = orchestrator.sync_batch(
        {}, {note("t1", "Standing water by gate"), note("t1", "Standing water by gate")},
        first.synced_at, worker());
    REQUIRE(second.notes_added == 1);
    REQUIRE(second.notes_skipped == 1);

    auto retry = orchestrator.sync_batch({}, {note("t1", "Standing water by gate")},
                                         first.synced_at, worker());
    REQUIRE(retry.notes_added == 0);
    REQUIRE(retry.notes_skipped == 1);
    REQUIRE(repo.notes_for("t1").size() == 1);
    REQUIRE(repo.notes_for("t1")[0].created_at > first.synced_at);
}

TEST_CASE("Concurrent retries of one batch store each note once", "[sync]") {
    Fixture f;
    f.repo.put_task(make_task("t1", TaskStatus::InProgress));

    std::atomic<size_t> failed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto result = f.orchestrator().sync_batch(
                {}, {note("t1", "Pump pressure low")}, at_seconds(1000), worker());
            failed += result.errors.size();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failed == 0);
    REQUIRE(f.repo.notes_for("t1").size() == 1);
    REQUIRE(f.locks.size() == 0);
}

TEST_CASE("Malformed task update ids are rejected", "[sync]") {
    Fixture f;
    auto numeric = TaskUpdate::from_json(json{{"taskId", 42}, {"progress", 10}});
    REQUIRE(numeric.task_id.empty());
    REQUIRE(!numeric.fields.contains("taskId"));

    auto fallback = TaskUpdate::from_json(json{{"id", "t1"}});
    REQUIRE(fallback.task_id == "t1");

    auto result = f.orchestrator().sync_batch({numeric}, {}, at_seconds(1000), worker());
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].code == Errc::Validation);
}
