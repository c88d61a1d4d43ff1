#pragma once
#include <chrono>
#include <ostream>
#include <string>

#include "ftxui/dom/elements.hpp"

#include "cli/review_session.hpp"
#include "key_registry.hpp"
#include "task.hpp"

namespace tr {

// Cut `s` to at most `width` code points. Only display text is cut; callers
// keep the stored value.
std::string truncate_display(const std::string& s, std::size_t width);

// "3 days 4 hours ", "12 mins "
std::string format_age(std::chrono::seconds dur);

void print_element(std::ostream& out, ftxui::Element element);

// One listing row: position, review state, assignee, project, description, color.
ftxui::Element summary_row(const Task& task, int idx, int total, const ReviewSession& session);
void print_summary(std::ostream& out, const Task& task, int idx, int total, const ReviewSession& session);

// Full detail view used by the item editor.
void print_detail(std::ostream& out, const Task& task, int idx, int total, const ReviewSession& session);

// Key hints for `context`; `multiline` lays them out in rows.
ftxui::Element key_hints(const KeyRegistry& keys, const std::string& context, bool multiline);
void print_key_hints(std::ostream& out, const KeyRegistry& keys, const std::string& context, bool multiline);

// " <header>: " banner followed by the context's hints on one line.
void print_picker(std::ostream& out, const std::string& header, const KeyRegistry& keys,
                  const std::string& context);

// White on red, one line.
void print_warning(std::ostream& out, const std::string& message);

ftxui::Element banner(const std::string& text, ftxui::Color bg, ftxui::Color fg);

} // namespace tr
