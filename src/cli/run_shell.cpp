#include "cli/run_shell.hpp"

#include <sstream>

#include "cli/default_bindings.hpp"
#include "cli/render.hpp"
#include "cli/task_reviewer.hpp"
#include "task_edits.hpp"

namespace tr {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<std::string> pick(const KeyRegistry& keys, Prompter& io, const std::string& header,
                                const std::string& context) {
    print_picker(io.Out(), header, keys, context);
    return keys.maps_to(io.ReadKey(), context);
}

// Creates a pending task for the project and assignee named in the filter,
// asking for whichever is missing.
void create_task(TaskService& svc, const KeyRegistry& keys, Prompter& io,
                 const ReviewSession& session, const std::string& filter) {
    std::string project, user;
    std::istringstream iss(filter);
    std::string arg;
    while (iss >> arg) {
        if (arg.rfind("project:", 0) == 0) project = arg.substr(8);
        if (arg.rfind("+@", 0) == 0) user = arg.substr(1);
    }
    if (project.empty()) {
        auto p = pick(keys, io, "Project", ctx::kProject);
        if (!p) return;
        project = *p;
    }
    if (user.empty()) {
        auto a = pick(keys, io, "Assign To", ctx::kAssignee);
        if (!a) return;
        user = std::string(1, kAssigneeSigil) + *a;
    }

    Task t;
    t.project = project;
    t.status = TaskStatus::Pending;
    t.tags = {user, session.default_color};
    io.Out() << "\n";
    auto candidate = with_description(t, io.ReadLine("Enter description: "));
    if (!candidate) return;
    if (!svc.update(*candidate).imported()) {
        print_warning(io.Out(), "Task was not created.");
    }
}

} // namespace

std::optional<std::string> shell_step(TaskService& svc, const KeyRegistry& keys, Prompter& io,
                                      ReviewSession& session, const std::string& filter) {
    auto& out = io.Out();
    io.ClearScreen();
    print_key_hints(out, keys, ctx::kShell, true);
    out << "\n";
    print_element(out, banner("task " + filter + ">", ftxui::Color::Blue, ftxui::Color::White));

    int key = io.ReadKey();
    if (key == CTRL_C || key == END_OF_INPUT) return std::nullopt;
    if (key == ENTER) {
        if (!filter.empty()) {
            TaskReviewer reviewer(svc, keys, io, session);
            reviewer.review(svc.fetch(filter, session.sort_mode));
        }
        return filter;
    }

    auto act = keys.maps_to(key, ctx::kShell);
    if (!act) return filter;
    const std::string& a = *act;
    if (a == action::kQuit) return std::nullopt;
    if (a == action::kClear) return std::string();
    if (a == action::kCompleted) return filter + " " + kCompletedToken;
    if (a == action::kSearch) {
        out << "\n";
        return filter + " " + trim(io.ReadLine("Enter search terms: "));
    }
    if (a == action::kAssigned) {
        if (auto who = pick(keys, io, "Assign To", ctx::kAssignee)) return filter + " +@" + *who;
        return filter;
    }
    if (a == action::kProject) {
        if (auto p = pick(keys, io, "Project", ctx::kProject)) return filter + " project:" + *p;
        return filter;
    }
    if (a == action::kTag) {
        if (auto t = pick(keys, io, "Tag", ctx::kTag)) return filter + " +" + *t;
        return filter;
    }
    if (a == action::kNew) {
        create_task(svc, keys, io, session, filter);
        return filter;
    }
    return filter;
}

void run_shell(TaskService& svc, const KeyRegistry& keys, Prompter& io, ReviewSession& session,
               const std::string& initial_filter) {
    std::string filter = trim(initial_filter);
    while (true) {
        auto next = shell_step(svc, keys, io, session, filter);
        if (!next) return;
        filter = trim(*next);
    }
}

} // namespace tr
