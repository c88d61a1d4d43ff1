#pragma once
#include <optional>
#include <string>

#include "backend/task_service.hpp"
#include "cli/prompter.hpp"
#include "cli/review_session.hpp"
#include "key_registry.hpp"

namespace tr {

// Filter-accumulation loop. Enter reviews the tasks matching the current
// filter; the other keys extend, clear or act on it. Returns on quit.
void run_shell(TaskService& svc, const KeyRegistry& keys, Prompter& io, ReviewSession& session,
               const std::string& initial_filter);

// One shell step: returns the next filter, or std::nullopt to quit.
std::optional<std::string> shell_step(TaskService& svc, const KeyRegistry& keys, Prompter& io,
                                      ReviewSession& session, const std::string& filter);

} // namespace tr
