#pragma once

#include "action_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace hostbridge::platform {
class WindowSystem;
class Notifier;
}

namespace hostbridge::actions {

class ActionRegistry {
public:
    void add(std::unique_ptr<CommandHandler> handler);
    const CommandHandler* find(const std::string& command) const;
    size_t size() const { return handlers_.size(); }

private:
    std::unordered_map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

void register_window_actions(ActionRegistry& registry, platform::WindowSystem& windows);
void register_notification_actions(ActionRegistry& registry, platform::Notifier& notifier);

} // namespace hostbridge::actions
