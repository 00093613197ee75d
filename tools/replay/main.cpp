// fieldsync-replay - apply a recorded offline batch to an in-memory store
//
//   fieldsync-replay batch.json
//
// The document holds {tasks, updates, notes, lastSync, actor}. The sync
// result and the resulting tasks are written to stdout as JSON.

#include "fieldsync/fieldsync.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace {

fieldsync::expected<nlohmann::json, fieldsync::Error> read_document(const char* path) {
    std::ifstream in(path);
    if (!in) {
        return fieldsync::unexpected(fieldsync::Error::not_found(std::string("Cannot open ") + path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return fieldsync::util::parse_json(buffer.str());
}

int replay(const nlohmann::json& doc, const fieldsync::Config& config) {
    using namespace fieldsync;

    MemoryRepository repo;
    TaskLocks locks;
    NullBroadcaster broadcaster;

    if (auto it = doc.find("tasks"); it != doc.end() && it->is_array()) {
        for (const auto& entry : *it) {
            auto task = Task::from_json(entry);
            if (!task) {
                std::cerr << "Invalid task: " << task.error().to_string() << "\n";
                return 1;
            }
            repo.put_task(std::move(*task));
        }
    }

    std::vector<TaskUpdate> updates;
    if (auto it = doc.find("updates"); it != doc.end() && it->is_array()) {
        for (const auto& entry : *it) {
            updates.push_back(TaskUpdate::from_json(entry));
        }
    }

    std::vector<NoteSubmission> notes;
    if (auto it = doc.find("notes"); it != doc.end() && it->is_array()) {
        for (const auto& entry : *it) {
            notes.push_back(NoteSubmission::from_json(entry));
        }
    }

    Timestamp last_sync{};
    if (auto it = doc.find("lastSync"); it != doc.end() && it->is_string()) {
        auto parsed = parse_iso8601(it->get<std::string>());
        if (!parsed) {
            std::cerr << "Invalid lastSync: " << it->get<std::string>() << "\n";
            return 1;
        }
        last_sync = *parsed;
    }

    auto actor = Actor::from_json(doc.value("actor", nlohmann::json::object()));

    SyncOrchestrator orchestrator(repo, locks, broadcaster,
                                  make_resolver(config),
                                  SyncOptions::from_config(config));
    auto result = orchestrator.sync_batch(updates, notes, last_sync, actor);

    nlohmann::json out;
    out["result"] = result.to_json();
    out["tasks"] = to_json_array(repo.list_tasks());
    std::cout << out.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: fieldsync-replay <batch.json>\n";
        return 1;
    }

    try {
        auto config = fieldsync::Config::from_env();
        config.configure(fieldsync::default_logger());

        auto doc = read_document(argv[1]);
        if (!doc) {
            std::cerr << doc.error().to_string() << "\n";
            return 1;
        }
        if (!doc->is_object()) {
            std::cerr << "Batch document must be a JSON object\n";
            return 1;
        }
        return replay(*doc, config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
