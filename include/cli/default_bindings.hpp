#pragma once
#include <vector>

#include "key_registry.hpp"
#include "task.hpp"

namespace tr {

namespace ctx {
inline constexpr const char* kShell = "shell";
inline constexpr const char* kListing = "listing";
inline constexpr const char* kItemEditor = "item-editor";
inline constexpr const char* kColor = "color";
inline constexpr const char* kProject = "project";
inline constexpr const char* kAssignee = "assignee";
inline constexpr const char* kTag = "tag";
} // namespace ctx

namespace action {
// shared
inline constexpr const char* kQuit = "quit";
inline constexpr const char* kAssigned = "assigned";
inline constexpr const char* kProject = "project";
// shell
inline constexpr const char* kClear = "clear";
inline constexpr const char* kCompleted = "completed";
inline constexpr const char* kNew = "new";
inline constexpr const char* kTag = "tag";
inline constexpr const char* kSearch = "search";
// item editor
inline constexpr const char* kDescription = "description";
inline constexpr const char* kColor = "color";
inline constexpr const char* kTags = "tags";
inline constexpr const char* kReviewed = "reviewed";
inline constexpr const char* kBack = "back";
inline constexpr const char* kDelete = "delete";
inline constexpr const char* kDone = "done";
inline constexpr const char* kDisputed = "disputed";
// listing
inline constexpr const char* kFix = "fix";
inline constexpr const char* kToggleShowAll = "toggle show all";
inline constexpr const char* kReview = "review";
inline constexpr const char* kSortUrgency = "sort by urgency";
inline constexpr const char* kSortDate = "sort by date";
inline constexpr const char* kSortColor = "sort by color";
inline constexpr const char* kGoto = "goto";
} // namespace action

// Auto-assign keys for the projects, free-form tags and assignees seen in
// `open_tasks` (first-seen order), then layer the preferred keys of the
// built-in actions.
void seed_bindings(KeyRegistry& keys, const std::vector<Task>& open_tasks);

} // namespace tr
