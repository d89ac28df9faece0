#pragma once

#include "action_base.hpp"

#include "../platform/host_capabilities.hpp"

namespace hostbridge::actions {

class GetForegroundWindowAction final : public CommandHandler {
public:
	explicit GetForegroundWindowAction(platform::WindowSystem& windows) : windows_(windows) {}
	const char* name() const override { return "GetForegroundWindow"; }
	std::string invoke(const ActionContext& ctx) const override;

private:
	platform::WindowSystem& windows_;
};

}
