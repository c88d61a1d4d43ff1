// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>

#include "tr_types.hpp"

// Kept in the global namespace to match the CLI entry point.
struct CliConfig {
    std::string loaded_config_path;
    std::string task_command = "task";
    std::string keys_path = "~/.taskreview_keys.yaml";
    // Empty means "r:<login name>", resolved by default_review_tag().
    std::string review_tag;
    std::string initial_filter;
    int review_window_hours = 24;
    int listing_rows = 30;
    int description_width = 60;
    std::string default_sort = "urgency";
    std::string default_color = "green";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default path and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// "~/.taskreview.yaml"
std::string default_config_path();

// Expand a leading "~/" to the user's home directory.
tr::fs::path expand_home(const std::string& path);

// "r:" followed by the login name.
std::string default_review_tag();
