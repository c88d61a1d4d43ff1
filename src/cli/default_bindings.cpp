#include "cli/default_bindings.hpp"

namespace tr {

void seed_bindings(KeyRegistry& keys, const std::vector<Task>& open_tasks) {
    for (const auto& task : open_tasks) {
        if (task.is_completed() || task.status == TaskStatus::Deleted) continue;
        keys.auto_assign(task.project, ctx::kProject);
        for (const auto& t : task.tags) {
            if (t.empty()) continue;
            if (is_normal_tag(t)) {
                keys.auto_assign(t, ctx::kTag);
            } else if (t[0] == kAssigneeSigil) {
                keys.auto_assign(t.substr(1), ctx::kAssignee);
            }
        }
    }

    keys.best_effort_assign('r', "red", ctx::kColor);
    keys.best_effort_assign('b', "blue", ctx::kColor);
    keys.best_effort_assign('g', "green", ctx::kColor);

    keys.best_effort_assign('q', action::kQuit, ctx::kShell);
    keys.best_effort_assign('c', action::kClear, ctx::kShell);
    keys.best_effort_assign('d', action::kCompleted, ctx::kShell);
    keys.best_effort_assign('a', action::kAssigned, ctx::kShell);
    keys.best_effort_assign('p', action::kProject, ctx::kShell);
    keys.best_effort_assign('n', action::kNew, ctx::kShell);
    keys.best_effort_assign('t', action::kTag, ctx::kShell);
    keys.best_effort_assign('s', action::kSearch, ctx::kShell);

    keys.best_effort_assign('e', action::kDescription, ctx::kItemEditor);
    keys.best_effort_assign('a', action::kAssigned, ctx::kItemEditor);
    keys.best_effort_assign('p', action::kProject, ctx::kItemEditor);
    keys.best_effort_assign('c', action::kColor, ctx::kItemEditor);
    keys.best_effort_assign('t', action::kTags, ctx::kItemEditor);
    keys.best_effort_assign('r', action::kReviewed, ctx::kItemEditor);
    keys.best_effort_assign('b', action::kBack, ctx::kItemEditor);
    keys.best_effort_assign('q', action::kQuit, ctx::kItemEditor);
    keys.best_effort_assign('x', action::kDelete, ctx::kItemEditor);
    keys.best_effort_assign('d', action::kDone, ctx::kItemEditor);
    keys.best_effort_assign('i', action::kDisputed, ctx::kItemEditor);

    keys.best_effort_assign('f', action::kFix, ctx::kListing);
    keys.best_effort_assign('a', action::kToggleShowAll, ctx::kListing);
    keys.best_effort_assign('r', action::kReview, ctx::kListing);
    keys.best_effort_assign('u', action::kSortUrgency, ctx::kListing);
    keys.best_effort_assign('d', action::kSortDate, ctx::kListing);
    keys.best_effort_assign('c', action::kSortColor, ctx::kListing);
    keys.best_effort_assign('g', action::kGoto, ctx::kListing);
    keys.best_effort_assign('q', action::kQuit, ctx::kListing);
}

} // namespace tr
