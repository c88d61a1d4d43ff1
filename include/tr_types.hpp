#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>

namespace tr {
namespace fs = std::filesystem;

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

enum class ReviewErrc {
    Unknown = 1, Transport, InvalidPayload, IdentityConflict, NotFound, Io,
};

// Fatal failures. Recoverable outcomes (conflicts, unbound keys, bad jump
// targets) are returned as values instead.
struct ReviewError : public std::runtime_error {
    explicit ReviewError(const std::string& what)
        : std::runtime_error(what), code_(ReviewErrc::Unknown) {}
    ReviewError(ReviewErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ReviewErrc code() const noexcept { return code_; }
private:
    ReviewErrc code_;
};

inline TimePoint system_now() { return std::chrono::system_clock::now(); }

} // namespace tr
