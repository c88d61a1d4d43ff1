#include "task.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace tr {

namespace {

const char* const kKnownFields[] = {
    "uuid", "xid", "description", "project", "status", "entry",
    "end", "modified", "reviewed", "urgency", "tags",
};

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ReviewError(ReviewErrc::InvalidPayload,
                          std::string("Field '") + key + "' is not a string.");
    }
    return it->get<std::string>();
}

std::time_t utc_to_time_t(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

std::optional<TaskStatus> parse_status(const std::string& s) {
    if (s == "pending") return TaskStatus::Pending;
    if (s == "completed") return TaskStatus::Completed;
    if (s == "deleted") return TaskStatus::Deleted;
    return std::nullopt;
}

std::string status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Deleted: return "deleted";
    }
    return "pending";
}

std::optional<TimePoint> parse_stamp(const std::string& s) {
    if (s.size() != 16 || s[8] != 'T' || s[15] != 'Z') return std::nullopt;
    for (size_t i = 0; i < 15; ++i) {
        if (i == 8) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    std::tm tm{};
    if (std::sscanf(s.c_str(), "%4d%2d%2dT%2d%2d%2dZ", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t t = utc_to_time_t(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::string format_stamp(TimePoint t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

bool is_color_tag(const std::string& tag) {
    return std::find(kColorTags.begin(), kColorTags.end(), tag) != kColorTags.end();
}

bool is_normal_tag(const std::string& tag) {
    if (tag.empty()) return false;
    if (tag[0] >= 'A' && tag[0] <= 'Z') return false;
    if (tag[0] == kAssigneeSigil || tag[0] == '-') return false;
    return !is_color_tag(tag);
}

Task Task::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ReviewError(ReviewErrc::InvalidPayload, "Task record is not a JSON object.");
    }
    Task t;
    t.uuid = optional_string(j, "uuid").value_or("");
    t.xid = optional_string(j, "xid").value_or("");
    t.description = optional_string(j, "description").value_or("");
    t.project = optional_string(j, "project").value_or("");
    std::string status = optional_string(j, "status").value_or("pending");
    if (auto parsed = parse_status(status)) {
        t.status = *parsed;
    } else {
        // waiting, recurring: reviewed as open, written back as received.
        t.status = TaskStatus::Pending;
        t.extra["status"] = status;
    }
    t.entry = optional_string(j, "entry").value_or("");
    t.end = optional_string(j, "end");
    t.modified = optional_string(j, "modified");
    t.reviewed = optional_string(j, "reviewed");
    if (t.end && !parse_stamp(*t.end)) {
        throw ReviewError(ReviewErrc::InvalidPayload,
                          "Bad completion time '" + *t.end + "' on task " + t.uuid);
    }
    if (auto it = j.find("urgency"); it != j.end() && it->is_number()) {
        t.urgency = it->get<double>();
    }
    if (auto it = j.find("tags"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw ReviewError(ReviewErrc::InvalidPayload, "Field 'tags' is not an array.");
        }
        for (const auto& tag : *it) {
            if (!tag.is_string()) {
                throw ReviewError(ReviewErrc::InvalidPayload, "Non-string tag on task " + t.uuid);
            }
            t.tags.push_back(tag.get<std::string>());
        }
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(std::begin(kKnownFields), std::end(kKnownFields), it.key()) !=
            std::end(kKnownFields)) {
            continue;
        }
        // The short numeric id is reassigned by the backend; never send it back.
        if (it.key() == "id") continue;
        t.extra[it.key()] = it.value();
    }
    return t;
}

nlohmann::json Task::to_json() const {
    nlohmann::json j = extra.is_object() ? extra : nlohmann::json::object();
    if (!uuid.empty()) j["uuid"] = uuid;
    if (!xid.empty()) j["xid"] = xid;
    if (!description.empty()) j["description"] = description;
    if (!project.empty()) j["project"] = project;
    if (status != TaskStatus::Pending || !j.contains("status")) j["status"] = status_name(status);
    if (!entry.empty()) j["entry"] = entry;
    if (end) j["end"] = *end;
    if (modified) j["modified"] = *modified;
    if (reviewed) j["reviewed"] = *reviewed;
    if (urgency != 0.0) j["urgency"] = urgency;
    if (!tags.empty()) j["tags"] = tags;
    return j;
}

bool Task::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::optional<std::string> Task::color_tag() const {
    for (const auto& t : tags) {
        if (is_color_tag(t)) return t;
    }
    return std::nullopt;
}

std::optional<std::string> Task::assignee_tag() const {
    for (const auto& t : tags) {
        if (!t.empty() && t[0] == kAssigneeSigil) return t;
    }
    return std::nullopt;
}

bool Task::is_disputed() const {
    return has_tag(kDisputedTag);
}

bool Task::is_reviewed(TimePoint now, const std::string& review_tag,
                       std::chrono::seconds window) const {
    if (!end) {
        if (!reviewed) return false;
        auto marker = parse_stamp(*reviewed);
        if (!marker) return false;
        return now - *marker < window;
    }
    return has_tag(review_tag);
}

TimePoint Task::sort_time() const {
    const std::string& ts = end ? *end : entry;
    return parse_stamp(ts).value_or(TimePoint{});
}

int Task::color_rank() const {
    auto c = color_tag();
    if (!c) return 3;
    if (*c == "red") return 0;
    if (*c == "blue") return 1;
    return 2;
}

} // namespace tr
