#include "backend/task_service.hpp"

#include <sstream>

namespace tr {

namespace {

constexpr std::chrono::hours kWeek{24 * 7};

} // namespace

std::vector<nlohmann::json> TaskService::export_records(const std::vector<std::string>& args) const {
    std::string raw = backend_.export_tasks(args);
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw ReviewError(ReviewErrc::InvalidPayload,
                          std::string("Backend export is not valid JSON: ") + e.what());
    }
    if (!parsed.is_array()) {
        throw ReviewError(ReviewErrc::InvalidPayload, "Backend export is not a JSON array.");
    }
    return parsed.get<std::vector<nlohmann::json>>();
}

std::vector<Task> TaskService::fetch(const std::string& filter, SortMode mode) const {
    std::istringstream iss(filter);
    std::vector<std::string> args;
    int weeks = 0;
    std::string tok;
    while (iss >> tok) {
        if (tok == kCompletedToken) {
            ++weeks;
            continue;
        }
        args.push_back(tok);
    }

    const TimePoint now = clock_();
    std::vector<Task> tasks;
    for (const auto& record : export_records(args)) {
        if (!record.is_object()) {
            throw ReviewError(ReviewErrc::InvalidPayload, "Task record is not a JSON object.");
        }
        // Deleted tasks are gone for review purposes; recurring templates and
        // other statuses are not reviewable items.
        auto it = record.find("status");
        auto status = (it != record.end() && it->is_string()) ? parse_status(it->get<std::string>())
                                                              : std::optional<TaskStatus>(TaskStatus::Pending);
        if (!status || *status == TaskStatus::Deleted) continue;

        Task t = Task::from_json(record);
        if (weeks > 0) {
            if (!t.end) continue;
            if (now - t.sort_time() < weeks * kWeek) tasks.push_back(std::move(t));
        } else if (!t.end) {
            tasks.push_back(std::move(t));
        }
    }
    sort_tasks(tasks, mode);
    return tasks;
}

Task TaskService::get(const std::string& uuid) const {
    auto records = export_records({uuid});
    if (records.empty()) {
        throw ReviewError(ReviewErrc::NotFound, "No task with UUID " + uuid);
    }
    if (records.size() > 1) {
        throw ReviewError(ReviewErrc::IdentityConflict,
                          "Expected exactly one task with UUID " + uuid + ", found " +
                              std::to_string(records.size()));
    }
    return Task::from_json(records.front());
}

UpdateOutcome TaskService::update(const Task& task) const {
    if (!task.uuid.empty()) {
        auto records = export_records({task.uuid});
        if (records.size() > 1) {
            throw ReviewError(ReviewErrc::IdentityConflict,
                              "Didn't expect more than one task with UUID " + task.uuid);
        }
        if (records.size() == 1) {
            // Only the stamp is compared; the rest of the record may be in
            // any shape another client left it.
            const nlohmann::json& current = records.front();
            std::optional<std::string> remote;
            if (current.is_object()) {
                auto it = current.find("modified");
                if (it != current.end() && it->is_string()) remote = it->get<std::string>();
            }
            if (remote != task.modified) {
                UpdateOutcome outcome;
                outcome.status = UpdateStatus::Conflict;
                outcome.local_modified = task.modified;
                outcome.remote_modified = remote;
                return outcome;
            }
        }
    }
    backend_.import_task(task.to_json().dump());
    return {};
}

} // namespace tr
