#include "cli/render.hpp"

#include <cstdio>
#include <ctime>

#include "ftxui/dom/node.hpp"
#include "ftxui/screen/color.hpp"
#include "ftxui/screen/screen.hpp"

using namespace ftxui;

namespace tr {

namespace {

constexpr std::size_t kHintsPerRow = 4;

std::string format_day(TimePoint t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y %b %d %a", &tm);
    return buf;
}

Color color_for_tag(const std::string& tag) {
    if (tag == "red") return Color::Red;
    if (tag == "green") return Color::Green;
    if (tag == "blue") return Color::Blue;
    return Color::Black;
}

Element field_line(const std::string& label, const std::string& value) {
    return hbox({text(label) | size(WIDTH, EQUAL, 14), text(value)});
}

} // namespace

std::string truncate_display(const std::string& s, std::size_t width) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        // Count lead bytes only; continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (count == width) return s.substr(0, i);
        ++count;
    }
    return s;
}

std::string format_age(std::chrono::seconds dur) {
    using std::chrono::hours;
    using std::chrono::minutes;
    std::string res;
    if (dur >= hours(24)) {
        auto days = dur / hours(24);
        res += std::to_string(days) + " days ";
        dur -= hours(24) * days;
    }
    if (dur >= hours(1)) {
        res += std::to_string(std::chrono::duration_cast<hours>(dur).count()) + " hours ";
    } else {
        res += std::to_string(std::chrono::duration_cast<minutes>(dur).count()) + " mins ";
    }
    return res;
}

void print_element(std::ostream& out, Element element) {
    auto screen = Screen::Create(Dimension::Fit(element));
    Render(screen, element);
    out << screen.ToString() << "\n";
}

Element banner(const std::string& label, Color bg, Color fg) {
    return text(label) | bgcolor(bg) | color(fg);
}

void print_warning(std::ostream& out, const std::string& message) {
    print_element(out, banner(message, Color::Red, Color::White));
}

Element summary_row(const Task& task, int idx, int total, const ReviewSession& session) {
    char pos[32];
    std::snprintf(pos, sizeof(pos), " [%2d of %2d] ", idx, total);

    Element state;
    if (task.status == TaskStatus::Deleted) {
        state = banner(" X ", Color::Red, Color::White);
    } else if (task.is_disputed()) {
        state = banner(" D ", Color::Red, Color::White);
    } else if (session.is_reviewed(task)) {
        state = banner(" R ", Color::Green, Color::Black);
    } else {
        state = banner(" N ", Color::Blue, Color::White);
    }

    const std::string user = task.assignee_tag().value_or("");
    const std::string ptag = task.color_tag().value_or("");
    const std::string desc = truncate_display(task.description, session.description_width);
    const int desc_width = static_cast<int>(session.description_width) + 1;

    Color ptag_bg = ptag.empty() ? Color::Black : color_for_tag(ptag);
    Color ptag_fg = ptag == "green" ? Color::Black : Color::White;

    return hbox({
        banner(pos, Color::Red, Color::White),
        state,
        hbox({filler(), text(user + " ")}) | size(WIDTH, EQUAL, 15) | bgcolor(Color::Yellow) | color(Color::Black),
        hbox({filler(), text(task.project + " ")}) | size(WIDTH, EQUAL, 14) | bgcolor(Color::Cyan),
        text(" " + desc) | size(WIDTH, EQUAL, desc_width) | bgcolor(Color::White) | color(Color::Black),
        text(" " + ptag) | size(WIDTH, EQUAL, 12) | bgcolor(ptag_bg) | color(ptag_fg),
    });
}

void print_summary(std::ostream& out, const Task& task, int idx, int total, const ReviewSession& session) {
    print_element(out, summary_row(task, idx, total, session));
}

void print_detail(std::ostream& out, const Task& task, int idx, int total, const ReviewSession& session) {
    static const Color kTagColors[] = {Color::Red, Color::Green, Color::Yellow,
                                       Color::Blue, Color::Magenta, Color::Cyan};
    const TimePoint now = session.now();

    Elements lines;
    lines.push_back(summary_row(task, idx, total, session));
    lines.push_back(text(""));
    if (truncate_display(task.description, session.description_width) != task.description) {
        lines.push_back(field_line("Description:", task.description));
    }

    Elements tag_cells = {text("Tags:") | size(WIDTH, EQUAL, 13)};
    std::size_t n = 0;
    for (const auto& t : task.tags) {
        if (!is_normal_tag(t)) continue;
        tag_cells.push_back(text(" " + t) | color(kTagColors[n++ % 6]));
    }
    lines.push_back(hbox(std::move(tag_cells)));

    auto started = parse_stamp(task.entry);
    auto finished = task.end ? parse_stamp(*task.end) : std::optional<TimePoint>(now);
    lines.push_back(field_line("Started:", started ? format_day(*started) : "-"));
    if (task.end && finished) {
        auto ago = std::chrono::duration_cast<std::chrono::seconds>(now - *finished);
        lines.push_back(field_line("Completed:", format_day(*finished) + " [" + format_age(ago) + "ago]"));
    }
    if (started && finished) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(*finished - *started);
        lines.push_back(field_line("Age:", format_age(age)));
    }
    lines.push_back(field_line("UUID:", task.uuid));
    lines.push_back(field_line("XID:", task.xid));
    lines.push_back(text(""));

    out << "\n";
    print_element(out, vbox(std::move(lines)));
}

Element key_hints(const KeyRegistry& keys, const std::string& context, bool multiline) {
    Decorator cell_width = multiline ? size(WIDTH, EQUAL, 24) : Decorator(nothing);
    Elements cells;
    for (const auto& b : keys.bindings(context)) {
        cells.push_back(hbox({
            text(std::string(" ") + b.key + " ") | inverted | bold,
            text(" " + b.value + " "),
        }) | cell_width);
    }
    if (!multiline) return hbox(std::move(cells));

    Elements rows;
    for (std::size_t i = 0; i < cells.size(); i += kHintsPerRow) {
        Elements row;
        for (std::size_t j = i; j < cells.size() && j < i + kHintsPerRow; ++j) row.push_back(cells[j]);
        rows.push_back(hbox(std::move(row)));
    }
    return vbox(std::move(rows));
}

void print_key_hints(std::ostream& out, const KeyRegistry& keys, const std::string& context, bool multiline) {
    print_element(out, key_hints(keys, context, multiline));
}

void print_picker(std::ostream& out, const std::string& header, const KeyRegistry& keys,
                  const std::string& context) {
    print_element(out, hbox({banner(" " + header + ": ", Color::Red, Color::White),
                             key_hints(keys, context, false)}));
}

} // namespace tr
