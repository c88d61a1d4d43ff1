#include "cli/task_reviewer.hpp"

#include <sstream>

#include "cli/default_bindings.hpp"
#include "cli/render.hpp"
#include "task_edits.hpp"

namespace tr {

namespace {

const char* sort_label(SortMode mode) {
    switch (mode) {
        case SortMode::Urgency: return "Urgency";
        case SortMode::Date: return "Date";
        case SortMode::Color: return "Color";
    }
    return "Urgency";
}

} // namespace

void TaskReviewer::review(std::vector<Task> tasks) {
    tasks_ = std::move(tasks);
    int index = 0;
    ReviewState state = ReviewState::Listing;
    while (state != ReviewState::Done) {
        state = state == ReviewState::Listing ? show_listing(index) : edit_at(index);
    }
}

void TaskReviewer::rebuild_visible() {
    visible_.clear();
    for (std::size_t i = 0; i < tasks_.size(); ++i) {
        if (session_.show_all || !session_.is_reviewed(tasks_[i])) visible_.push_back(i);
    }
}

ReviewState TaskReviewer::show_listing(int& index) {
    rebuild_visible();
    const int total = static_cast<int>(visible_.size());
    auto& out = io_.Out();

    io_.ClearScreen();
    if (!session_.show_all) {
        out << "> " << tasks_.size() - visible_.size() << " tasks already reviewed.\n";
    } else {
        out << "> Showing all tasks.\n";
    }
    out << "> Sorted by " << sort_label(session_.sort_mode) << ".\n\n";
    for (std::size_t i = 0; i < visible_.size() && i < session_.listing_rows; ++i) {
        print_summary(out, tasks_[visible_[i]], static_cast<int>(i), total, session_);
    }
    out << "\nFound " << total << " tasks.\n";
    print_key_hints(out, keys_, ctx::kListing, true);

    int key = io_.ReadKey();
    if (key == ENTER || key == CTRL_C || key == END_OF_INPUT) return ReviewState::Done;

    auto act = keys_.maps_to(key, ctx::kListing);
    if (!act) return ReviewState::Listing;
    const std::string& a = *act;

    if (a == action::kGoto) {
        auto jump = read_jump();
        // Out of range is a no-op, not a clamp.
        if (jump && *jump >= 0 && *jump < total) {
            index = *jump;
            return ReviewState::Editing;
        }
        return ReviewState::Listing;
    }
    if (a == action::kReview) {
        index = 0;
        return ReviewState::Editing;
    }
    if (a == action::kToggleShowAll) {
        session_.show_all = !session_.show_all;
        return ReviewState::Listing;
    }
    if (a == action::kSortUrgency || a == action::kSortDate || a == action::kSortColor) {
        session_.sort_mode = a == action::kSortUrgency ? SortMode::Urgency
                           : a == action::kSortDate    ? SortMode::Date
                                                       : SortMode::Color;
        sort_tasks(tasks_, session_.sort_mode);
        return ReviewState::Listing;
    }
    if (a == action::kFix) {
        bulk_fix();
        return ReviewState::Listing;
    }
    if (a == action::kQuit) return ReviewState::Done;
    return ReviewState::Listing;
}

ReviewState TaskReviewer::edit_at(int& index) {
    const int total = static_cast<int>(visible_.size());
    if (index < 0) return ReviewState::Listing;
    if (index >= total) return ReviewState::Done;

    Task& slot = tasks_[visible_[index]];
    EditStep step = edit_task(slot, index);
    if (step.wrote && !slot.uuid.empty()) {
        slot = svc_.get(slot.uuid); // refresh
    }
    if (step.quit) return ReviewState::Done;

    index += step.delta;
    if (index < 0) return ReviewState::Listing;
    if (index >= total) return ReviewState::Done;
    return ReviewState::Editing;
}

TaskReviewer::EditStep TaskReviewer::edit_task(const Task& task, int index) {
    auto& out = io_.Out();
    io_.ClearScreen();
    print_detail(out, task, index, static_cast<int>(visible_.size()), session_);
    print_key_hints(out, keys_, ctx::kItemEditor, true);

    EditStep step;
    int key = io_.ReadKey();
    if (key == CTRL_C || key == END_OF_INPUT) {
        step.quit = true;
        return step;
    }
    if (key == LEFT) {
        step.delta = -1;
        return step;
    }
    auto act = keys_.maps_to(key, ctx::kItemEditor);
    if (!act) return step;
    const std::string& a = *act;

    if (a == action::kBack) {
        step.delta = -1;
        return step;
    }
    if (a == action::kQuit) {
        step.quit = true;
        return step;
    }

    std::optional<Task> candidate;
    if (a == action::kDescription) {
        out << "\n";
        candidate = with_description(task, io_.ReadLine("Enter description: "));
    } else if (a == action::kAssigned) {
        if (auto who = pick("Assign To", ctx::kAssignee)) candidate = with_assignee(task, *who);
    } else if (a == action::kProject) {
        if (auto project = pick("Project", ctx::kProject)) candidate = with_project(task, *project);
    } else if (a == action::kColor) {
        if (auto c = pick("Task Color", ctx::kColor)) candidate = with_color(task, *c);
    } else if (a == action::kTags) {
        if (auto tag = pick("Tags", ctx::kTag)) candidate = with_tag_toggled(task, *tag);
    } else if (a == action::kReviewed) {
        candidate = marked_reviewed(task, session_.now(), session_.review_tag, session_.review_window);
        if (!candidate) return step; // already reviewed
    } else if (a == action::kDone) {
        candidate = marked_done(task, session_.now());
    } else if (a == action::kDelete) {
        candidate = marked_deleted(task);
    } else if (a == action::kDisputed) {
        candidate = marked_disputed(task);
        if (!candidate) return step; // already disputed
    } else {
        return step; // stale binding
    }

    if (!candidate) {
        // Cancelled picker or empty description: keep the task on screen.
        step.delta = 0;
        return step;
    }
    step.wrote = true;
    if (!commit(*candidate, true)) step.delta = 0;
    return step;
}

bool TaskReviewer::commit(const Task& candidate, bool acknowledge) {
    UpdateOutcome outcome = svc_.update(candidate);
    if (outcome.imported()) return true;

    auto& out = io_.Out();
    std::ostringstream msg;
    msg << "Task's mod time has changed [\"" << outcome.local_modified.value_or("") << "\" -> \""
        << outcome.remote_modified.value_or("") << "\"]. Please refresh before updating.";
    print_warning(out, msg.str());
    if (acknowledge) {
        out << "Press any key to refresh.\n";
        io_.ReadKey();
    }
    return false;
}

std::optional<std::string> TaskReviewer::pick(const std::string& header, const std::string& context) {
    print_picker(io_.Out(), header, keys_, context);
    return keys_.maps_to(io_.ReadKey(), context);
}

std::optional<int> TaskReviewer::read_jump() {
    std::istringstream iss(io_.ReadLine("Jump to: "));
    int value = 0;
    if (!(iss >> value)) return std::nullopt;
    iss >> std::ws;
    if (!iss.eof()) return std::nullopt;
    return value;
}

void TaskReviewer::bulk_fix() {
    auto& out = io_.Out();
    for (std::size_t pos : visible_) {
        Task& t = tasks_[pos];
        if (t.color_tag()) continue;
        out << "Fixing task: " << t.description << "\n";
        if (!commit(with_color(t, session_.default_color), false)) {
            out << "Skipped: modified elsewhere.\n";
        }
        if (!t.uuid.empty()) t = svc_.get(t.uuid);
    }
}

} // namespace tr
