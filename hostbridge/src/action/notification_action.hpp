#pragma once

#include "action_base.hpp"

#include "../platform/host_capabilities.hpp"

namespace hostbridge::actions {

class ShowNotificationAction final : public CommandHandler {
public:
	explicit ShowNotificationAction(platform::Notifier& notifier) : notifier_(notifier) {}
	const char* name() const override { return "ShowNotification"; }
	std::string invoke(const ActionContext& ctx) const override;

	/// SoundOpt (bool, default false), Title and Message (required strings).
	static NotificationRequest parse_request(const ActionContext& ctx);

private:
	platform::Notifier& notifier_;
};

}
