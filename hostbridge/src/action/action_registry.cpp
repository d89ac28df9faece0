#include "action_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hostbridge::actions {

void ActionRegistry::add(std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    std::string name = handler->name();
    if (!handlers_.emplace(name, std::move(handler)).second) {
        LOG4CPLUS_WARN(action_logger(), "Duplicate handler ignored: " << name);
    }
}

const CommandHandler* ActionRegistry::find(const std::string& command) const {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace hostbridge::actions
