#include "sort_engine.hpp"

#include <algorithm>

namespace tr {

std::optional<SortMode> parse_sort_mode(const std::string& s) {
    if (s == "urgency") return SortMode::Urgency;
    if (s == "date") return SortMode::Date;
    if (s == "color") return SortMode::Color;
    return std::nullopt;
}

std::string sort_mode_name(SortMode mode) {
    switch (mode) {
        case SortMode::Urgency: return "urgency";
        case SortMode::Date: return "date";
        case SortMode::Color: return "color";
    }
    return "urgency";
}

void sort_tasks(std::vector<Task>& tasks, SortMode mode) {
    switch (mode) {
        case SortMode::Urgency:
            std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
                return a.urgency > b.urgency;
            });
            break;
        case SortMode::Date:
            std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
                return a.sort_time() > b.sort_time();
            });
            break;
        case SortMode::Color:
            std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
                return a.color_rank() < b.color_rank();
            });
            break;
    }
}

} // namespace tr
