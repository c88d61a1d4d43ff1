#pragma once
#include <optional>
#include <string>
#include <vector>

#include "task.hpp"

namespace tr {

enum class SortMode { Urgency, Date, Color };

std::optional<SortMode> parse_sort_mode(const std::string& s);
std::string sort_mode_name(SortMode mode);

// Stable: tasks with equal keys keep their relative order.
void sort_tasks(std::vector<Task>& tasks, SortMode mode);

} // namespace tr
