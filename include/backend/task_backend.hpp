#pragma once
#include <string>
#include <vector>

namespace tr {

// Text-level transport to the task store. Implementations throw
// ReviewError(ReviewErrc::Transport) when the exchange fails.
class TaskBackend {
public:
    virtual ~TaskBackend() = default;

    // Runs an export restricted by `filter_args`; returns the raw JSON array.
    virtual std::string export_tasks(const std::vector<std::string>& filter_args) = 0;
    // Submits one serialized task to the import channel.
    virtual void import_task(const std::string& json) = 0;
};

} // namespace tr
