#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tr_types.hpp"

namespace tr {

enum class TaskStatus { Pending, Completed, Deleted };

// Reserved label vocabulary.
inline const std::vector<std::string> kColorTags = {"red", "green", "blue"};
inline const std::string kDisputedTag = "disputed";
constexpr char kAssigneeSigil = '@';
constexpr std::chrono::hours kDefaultReviewWindow{24};

std::optional<TaskStatus> parse_status(const std::string& s);
std::string status_name(TaskStatus status);

// Backend timestamps are compact UTC: 20060102T150405Z.
std::optional<TimePoint> parse_stamp(const std::string& s);
std::string format_stamp(TimePoint t);

bool is_color_tag(const std::string& tag);
// Free-form label: not a color, not an assignee, not starting with an
// uppercase letter or '-'.
bool is_normal_tag(const std::string& tag);

/**
 * @class Task
 * @brief One tracked item as exported by the backend.
 *
 * - uuid: backend identity, empty for a task that has not been imported yet.
 * - xid: short display id.
 * - entry / end / modified / reviewed: compact UTC timestamps; end, modified
 *   and reviewed are optional and omitted on the wire when absent.
 * - tags: labels. Colors, the '@' assignee and "disputed" are reserved.
 * - extra: attributes this model does not interpret. They are written back
 *   untouched so an edit never drops annotations, due dates or UDAs. A
 *   backend status outside the three above (waiting, recurring) is kept here
 *   and `status` reads Pending; marking the task done or deleted replaces it.
 */
class Task {
public:
    std::string uuid;
    std::string xid;
    std::string description;
    std::string project;
    TaskStatus status = TaskStatus::Pending;
    std::string entry;
    std::optional<std::string> end;
    std::optional<std::string> modified;
    std::optional<std::string> reviewed;
    double urgency = 0.0;
    std::vector<std::string> tags;
    nlohmann::json extra = nlohmann::json::object();

    static Task from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool has_tag(const std::string& tag) const;
    std::optional<std::string> color_tag() const;
    std::optional<std::string> assignee_tag() const;
    bool is_disputed() const;
    bool is_completed() const { return end.has_value(); }

    // Open tasks: the reviewed marker decays after `window`. Completed tasks
    // carry a per-reviewer tag instead, which never decays.
    bool is_reviewed(TimePoint now, const std::string& review_tag,
                     std::chrono::seconds window = kDefaultReviewWindow) const;

    // Completion time if present, else creation time. Unparsable stamps
    // sort as the epoch.
    TimePoint sort_time() const;
    // red < blue < green < no color
    int color_rank() const;
};

} // namespace tr
