#include "key_registry.hpp"

#include <cctype>
#include <fstream>
#include <iostream>

#include <yaml-cpp/yaml.h>

namespace tr {

namespace {

bool is_bindable(char c) {
    return std::isgraph(static_cast<unsigned char>(c)) != 0;
}

} // namespace

const std::string& KeyRegistry::fallback_alphabet() {
    static const std::string alphabet =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    return alphabet;
}

bool KeyRegistry::is_free(char key, const std::string& context) const {
    auto it = contexts_.find(context);
    if (it == contexts_.end()) return true;
    for (const auto& b : it->second) {
        if (b.key == key) return false;
    }
    return true;
}

bool KeyRegistry::bind(char key, const std::string& value, const std::string& context) {
    if (!is_bindable(key) || value.empty()) return false;
    if (!is_free(key, context) || key_for(value, context)) return false;
    contexts_[context].push_back({key, value});
    return true;
}

void KeyRegistry::auto_assign(const std::string& value, const std::string& context) {
    if (value.empty() || key_for(value, context)) return;
    for (char c : value) {
        if (bind(c, value, context)) return;
    }
}

void KeyRegistry::best_effort_assign(char preferred, const std::string& value,
                                     const std::string& context) {
    if (value.empty() || key_for(value, context)) return;
    if (bind(preferred, value, context)) return;
    for (char c : fallback_alphabet()) {
        if (bind(c, value, context)) return;
    }
}

std::optional<std::string> KeyRegistry::maps_to(int key, const std::string& context) const {
    if (key < 0 || key > 127) return std::nullopt;
    auto it = contexts_.find(context);
    if (it == contexts_.end()) return std::nullopt;
    for (const auto& b : it->second) {
        if (b.key == static_cast<char>(key)) return b.value;
    }
    return std::nullopt;
}

std::optional<char> KeyRegistry::key_for(const std::string& value, const std::string& context) const {
    auto it = contexts_.find(context);
    if (it == contexts_.end()) return std::nullopt;
    for (const auto& b : it->second) {
        if (b.value == value) return b.key;
    }
    return std::nullopt;
}

const std::vector<KeyRegistry::Binding>& KeyRegistry::bindings(const std::string& context) const {
    static const std::vector<Binding> empty;
    auto it = contexts_.find(context);
    return it == contexts_.end() ? empty : it->second;
}

void KeyRegistry::load(const fs::path& path) {
    if (!fs::exists(path)) return;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            std::cerr << "Warning: Key file '" << path.string()
                      << "' is not a mapping of contexts. Starting with fresh keys." << std::endl;
            return;
        }
        for (const auto& ctx : root) {
            const std::string context = ctx.first.as<std::string>();
            if (!ctx.second.IsMap()) continue;
            for (const auto& entry : ctx.second) {
                const std::string key = entry.first.as<std::string>();
                if (key.size() != 1 || !entry.second.IsScalar()) continue;
                // Entries colliding with an earlier one are dropped.
                bind(key[0], entry.second.as<std::string>(), context);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not parse key file '" << path.string()
                  << "'. Starting with fresh keys. Error: " << e.what() << std::endl;
    }
}

bool KeyRegistry::save(const fs::path& path) const {
    YAML::Node root(YAML::NodeType::Map);
    for (const auto& ctx : contexts_) {
        YAML::Node entries(YAML::NodeType::Map);
        for (const auto& b : ctx.second) entries[std::string(1, b.key)] = b.value;
        root[ctx.first] = entries;
    }

    std::ofstream fout(path);
    if (!fout) {
        std::cerr << "Warning: Could not save key bindings to " << path.string() << std::endl;
        return false;
    }
    fout << root << "\n";
    return static_cast<bool>(fout);
}

} // namespace tr
