#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace hostbridge {

using ArgumentValue = std::variant<std::string, int64_t, double, bool>;
using Arguments = std::unordered_map<std::string, ArgumentValue>;

/// One decoded request: {"Command": "<name>", "Arguments": {...}}
struct Command {
    std::string name;
    std::optional<Arguments> arguments; // absent when the request carries no "Arguments"
};

struct NotificationRequest {
    bool sound = false;
    std::string title;
    std::string message;
};

} // namespace hostbridge
