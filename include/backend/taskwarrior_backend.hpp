#pragma once
#include <string>
#include <utility>
#include <vector>

#include "backend/task_backend.hpp"

namespace tr {

// Talks to the Taskwarrior command line through a shell pipe.
class TaskwarriorBackend : public TaskBackend {
public:
    explicit TaskwarriorBackend(std::string task_command = "task")
        : task_command_(std::move(task_command)) {}

    std::string export_tasks(const std::vector<std::string>& filter_args) override;
    void import_task(const std::string& json) override;

    // POSIX single-quote escaping for one shell word.
    static std::string shell_quote(const std::string& arg);

private:
    std::string base_command() const;

    std::string task_command_;
};

} // namespace tr
