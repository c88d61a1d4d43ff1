// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

using namespace tr; // for fs

namespace {

fs::path home_dir() {
    const char* home = getenv("HOME");
#ifndef _WIN32
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        }
    }
#else
    if (home == nullptr) home = getenv("USERPROFILE");
#endif
    return home ? fs::path(home) : fs::path();
}

} // namespace

fs::path expand_home(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) {
        fs::path home = home_dir();
        if (home.empty()) return fs::path(path.substr(2)); // fallback to current dir
        return home / path.substr(2);
    }
    return fs::path(path);
}

std::string default_config_path() {
    return "~/.taskreview.yaml";
}

std::string default_review_tag() {
    const char* user = getenv("USER");
#ifndef _WIN32
    if (user == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) user = pw->pw_name;
    }
#else
    if (user == nullptr) user = getenv("USERNAME");
#endif
    return std::string("r:") + (user ? user : "");
}

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Taskreview configuration.";
    root["task_command"] = config.task_command;
    root["keys_path"] = config.keys_path;
    root["review_tag"] = config.review_tag;
    root["review_window_hours"] = config.review_window_hours;
    root["listing_rows"] = config.listing_rows;
    root["description_width"] = config.description_width;
    root["default_sort"] = config.default_sort;
    root["default_color"] = config.default_color;

    std::ofstream fout(expand_home(path));
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    fs::path resolved = expand_home(config_path);
    if (fs::exists(resolved)) {
        config.loaded_config_path = fs::absolute(resolved).string();
        try {
            YAML::Node root = YAML::LoadFile(resolved.string());
            if (root["task_command"]) config.task_command = root["task_command"].as<std::string>();
            if (root["keys_path"]) config.keys_path = root["keys_path"].as<std::string>();
            if (root["review_tag"]) config.review_tag = root["review_tag"].as<std::string>();
            if (root["review_window_hours"]) config.review_window_hours = root["review_window_hours"].as<int>();
            if (root["listing_rows"]) config.listing_rows = root["listing_rows"].as<int>();
            if (root["description_width"]) config.description_width = root["description_width"].as<int>();
            if (root["default_sort"]) config.default_sort = root["default_sort"].as<std::string>();
            if (root["default_color"]) config.default_color = root["default_color"].as<std::string>();
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == default_config_path()) {
        std::cout << "Configuration file '" << config_path << "' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, config_path)) {
            config.loaded_config_path = fs::absolute(resolved).string();
        }
    } else {
        std::cerr << "Warning: Config file '" << config_path << "' not found. Using default settings." << std::endl;
    }
}
