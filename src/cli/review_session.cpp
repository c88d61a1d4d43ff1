#include "cli/review_session.hpp"

#include <iostream>

namespace tr {

ReviewSession make_session(const CliConfig& config) {
    ReviewSession session;
    session.review_tag = config.review_tag.empty() ? default_review_tag() : config.review_tag;
    if (config.review_window_hours > 0) {
        session.review_window = std::chrono::hours(config.review_window_hours);
    }
    if (config.listing_rows > 0) session.listing_rows = static_cast<std::size_t>(config.listing_rows);
    if (config.description_width > 0) {
        session.description_width = static_cast<std::size_t>(config.description_width);
    }
    if (auto mode = parse_sort_mode(config.default_sort)) {
        session.sort_mode = *mode;
    } else {
        std::cerr << "Warning: Unknown sort mode '" << config.default_sort << "', using urgency." << std::endl;
    }
    if (is_color_tag(config.default_color)) {
        session.default_color = config.default_color;
    } else {
        std::cerr << "Warning: '" << config.default_color << "' is not a color tag, using green." << std::endl;
    }
    return session;
}

} // namespace tr
