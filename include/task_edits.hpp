#pragma once
#include <optional>
#include <string>

#include "task.hpp"

namespace tr {

// Each edit returns a modified copy; the caller routes it through
// TaskService::update. An empty optional means there is nothing to write.

std::optional<Task> with_description(const Task& task, const std::string& text);
// `name` is the assignee without the '@' sigil.
Task with_assignee(const Task& task, const std::string& name);
Task with_project(const Task& task, const std::string& project);
Task with_color(const Task& task, const std::string& color);
Task with_tag_toggled(const Task& task, const std::string& tag);

std::optional<Task> marked_reviewed(const Task& task, TimePoint now,
                                    const std::string& review_tag,
                                    std::chrono::seconds window = kDefaultReviewWindow);
Task marked_done(const Task& task, TimePoint now);
Task marked_deleted(const Task& task);
std::optional<Task> marked_disputed(const Task& task);

} // namespace tr
