#include "action_registry.hpp"
#include "notification_action.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hostbridge::actions {

namespace {

constexpr const char* kSoundKey = "SoundOpt";
constexpr const char* kTitleKey = "Title";
constexpr const char* kMessageKey = "Message";

} // namespace

NotificationRequest ShowNotificationAction::parse_request(const ActionContext& ctx) {
	const Arguments& args = require_arguments(ctx);
	NotificationRequest request;
	request.sound = optional_bool(ctx, args, kSoundKey, false);
	request.title = require_string(ctx, args, kTitleKey);
	request.message = require_string(ctx, args, kMessageKey);
	return request;
}

std::string ShowNotificationAction::invoke(const ActionContext& ctx) const {
	NotificationRequest request = parse_request(ctx);

	LOG4CPLUS_DEBUG(action_logger(), ctx.command << " title=\"" << request.title << "\" sound=" << request.sound);

	std::string error;
	if (!notifier_.show(request, error)) {
		throw HandlerError(error.empty() ? "notification failed" : error);
	}
	return "OK";
}

void register_notification_actions(ActionRegistry& registry, platform::Notifier& notifier) {
	registry.add(std::make_unique<ShowNotificationAction>(notifier));
}

} // namespace hostbridge::actions
