#include "action_registry.hpp"
#include "window_action.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hostbridge::actions {

std::string GetForegroundWindowAction::invoke(const ActionContext& ctx) const {
	uint64_t handle = 0;
	std::string error;
	if (!windows_.foreground_window(handle, error)) {
		throw HandlerError(error.empty() ? "foreground window query failed" : error);
	}
	LOG4CPLUS_DEBUG(action_logger(), ctx.command << " -> " << handle);
	return std::to_string(handle);
}

void register_window_actions(ActionRegistry& registry, platform::WindowSystem& windows) {
	registry.add(std::make_unique<GetForegroundWindowAction>(windows));
}

} // namespace hostbridge::actions
