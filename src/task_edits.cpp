#include "task_edits.hpp"

#include <algorithm>

namespace tr {

namespace {

template <typename Pred>
void strip_tags(Task& task, Pred pred) {
    task.tags.erase(std::remove_if(task.tags.begin(), task.tags.end(), pred), task.tags.end());
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::optional<Task> with_description(const Task& task, const std::string& text) {
    std::string desc = trim(text);
    if (desc.empty()) return std::nullopt;
    Task t = task;
    t.description = desc;
    return t;
}

Task with_assignee(const Task& task, const std::string& name) {
    Task t = task;
    strip_tags(t, [](const std::string& tag) { return !tag.empty() && tag[0] == kAssigneeSigil; });
    t.tags.push_back(std::string(1, kAssigneeSigil) + name);
    return t;
}

Task with_project(const Task& task, const std::string& project) {
    Task t = task;
    t.project = project;
    return t;
}

Task with_color(const Task& task, const std::string& color) {
    Task t = task;
    strip_tags(t, [](const std::string& tag) { return is_color_tag(tag); });
    t.tags.push_back(color);
    return t;
}

Task with_tag_toggled(const Task& task, const std::string& tag) {
    Task t = task;
    if (t.has_tag(tag)) {
        strip_tags(t, [&](const std::string& existing) { return existing == tag; });
    } else {
        t.tags.push_back(tag);
    }
    return t;
}

std::optional<Task> marked_reviewed(const Task& task, TimePoint now,
                                    const std::string& review_tag,
                                    std::chrono::seconds window) {
    if (task.is_reviewed(now, review_tag, window)) return std::nullopt;
    Task t = task;
    if (!t.end) {
        t.reviewed = format_stamp(now);
    } else {
        t.tags.push_back(review_tag);
    }
    return t;
}

Task marked_done(const Task& task, TimePoint now) {
    Task t = task;
    t.status = TaskStatus::Completed;
    if (!t.end) t.end = format_stamp(now);
    return t;
}

Task marked_deleted(const Task& task) {
    Task t = task;
    t.status = TaskStatus::Deleted;
    return t;
}

std::optional<Task> marked_disputed(const Task& task) {
    if (task.is_disputed()) return std::nullopt;
    Task t = task;
    t.tags.push_back(kDisputedTag);
    return t;
}

} // namespace tr
