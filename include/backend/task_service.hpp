#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "backend/task_backend.hpp"
#include "sort_engine.hpp"
#include "task.hpp"
#include "tr_types.hpp"

namespace tr {

// Filter token asking for completed tasks; each repetition widens the
// window by one week.
inline const std::string kCompletedToken = "_end";

enum class UpdateStatus { Imported, Conflict };

struct UpdateOutcome {
    UpdateStatus status = UpdateStatus::Imported;
    // Set on Conflict: the stamp captured at load time and the one the
    // backend holds now.
    std::optional<std::string> local_modified;
    std::optional<std::string> remote_modified;

    bool imported() const { return status == UpdateStatus::Imported; }
};

// Stateless adapter between the review engine and the backend. Every call
// re-derives truth from the backend.
class TaskService {
public:
    explicit TaskService(TaskBackend& backend, Clock clock = system_now)
        : backend_(backend), clock_(std::move(clock)) {}

    // Open tasks matching `filter`, or completed ones when the filter carries
    // kCompletedToken. Deleted tasks are never returned.
    std::vector<Task> fetch(const std::string& filter, SortMode mode) const;

    // Exactly one record by identity, whatever its status.
    Task get(const std::string& uuid) const;

    // Optimistic concurrency guard. Imports `task` only if the backend's
    // modified stamp still equals the one captured in memory.
    UpdateOutcome update(const Task& task) const;

private:
    std::vector<nlohmann::json> export_records(const std::vector<std::string>& args) const;

    TaskBackend& backend_;
    Clock clock_;
};

} // namespace tr
