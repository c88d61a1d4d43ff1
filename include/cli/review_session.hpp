#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "cli_config.hpp"
#include "sort_engine.hpp"
#include "task.hpp"
#include "tr_types.hpp"

namespace tr {

// Per-process review state shared by the shell, listing and editor.
struct ReviewSession {
    SortMode sort_mode = SortMode::Urgency;
    bool show_all = false;
    std::string review_tag = "r:reviewer";
    std::chrono::seconds review_window = kDefaultReviewWindow;
    std::size_t listing_rows = 30;
    std::size_t description_width = 60;
    std::string default_color = "green";
    Clock clock = system_now;

    TimePoint now() const { return clock(); }
    bool is_reviewed(const Task& task) const {
        return task.is_reviewed(now(), review_tag, review_window);
    }
};

ReviewSession make_session(const CliConfig& config);

} // namespace tr
