#include "backend/taskwarrior_backend.hpp"

#include <array>
#include <cstdio>

#include "tr_types.hpp"

namespace tr {

std::string TaskwarriorBackend::shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string TaskwarriorBackend::base_command() const {
    return shell_quote(task_command_) +
           " rc.confirmation=off rc.verbose=nothing rc.json.array=on";
}

std::string TaskwarriorBackend::export_tasks(const std::vector<std::string>& filter_args) {
    std::string cmd = base_command();
    for (const auto& arg : filter_args) cmd += " " + shell_quote(arg);
    cmd += " export";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw ReviewError(ReviewErrc::Transport, "Failed to start: " + cmd);
    }
    std::string out;
    std::array<char, 4096> buf{};
    size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        out.append(buf.data(), n);
    }
    int status = pclose(pipe);
    if (status != 0) {
        throw ReviewError(ReviewErrc::Transport,
                          "Export failed with status " + std::to_string(status) + ": " + cmd);
    }
    return out;
}

void TaskwarriorBackend::import_task(const std::string& json) {
    std::string cmd = base_command() + " import - >/dev/null";
    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) {
        throw ReviewError(ReviewErrc::Transport, "Failed to start: " + cmd);
    }
    size_t written = std::fwrite(json.data(), 1, json.size(), pipe);
    int status = pclose(pipe);
    if (written != json.size() || status != 0) {
        throw ReviewError(ReviewErrc::Transport,
                          "Import failed with status " + std::to_string(status) + " for " + json);
    }
}

} // namespace tr
