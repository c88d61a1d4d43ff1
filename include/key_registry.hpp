#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tr_types.hpp"

namespace tr {

// Single-character shortcuts per context. A context is an isolated namespace:
// "item-editor" and "listing" may both bind 'r' to different actions, but
// within one context a key maps to one value and a value to one key.
class KeyRegistry {
public:
    struct Binding {
        char key;
        std::string value;
    };

    // Bind the first free character of `value` itself. No-op if `value` is
    // already bound in `context` or every character is taken.
    void auto_assign(const std::string& value, const std::string& context);
    // Bind `preferred` if free, else the first free fallback character.
    void best_effort_assign(char preferred, const std::string& value, const std::string& context);

    std::optional<std::string> maps_to(int key, const std::string& context) const;
    std::optional<char> key_for(const std::string& value, const std::string& context) const;

    // Bindings in assignment order; empty for an unknown context.
    const std::vector<Binding>& bindings(const std::string& context) const;

    // A missing file leaves the registry empty.
    void load(const fs::path& path);
    bool save(const fs::path& path) const;

    static const std::string& fallback_alphabet();

private:
    bool is_free(char key, const std::string& context) const;
    bool bind(char key, const std::string& value, const std::string& context);

    std::map<std::string, std::vector<Binding>> contexts_;
};

} // namespace tr
