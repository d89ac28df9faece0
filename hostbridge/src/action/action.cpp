#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hostbridge::actions {

namespace {

void write_line(std::ostream& out, const std::string& line) {
	out << line << '\n';
	out.flush();
	if (!out) {
		LOG4CPLUS_ERROR(action_logger(), "Failed to write result to output stream");
		out.clear();
	}
}

} // namespace

const Arguments& CommandHandler::require_arguments(const ActionContext& ctx) {
	if (!ctx.arguments) {
		throw HandlerError(ctx.command + " requires Arguments");
	}
	return *ctx.arguments;
}

std::string CommandHandler::require_string(const ActionContext& ctx, const Arguments& args, const std::string& key) {
	const ArgumentValue* value = codec::find_argument(args, key);
	if (!value) {
		throw HandlerError(ctx.command + ": " + key + " is required");
	}
	if (!std::holds_alternative<std::string>(*value)) {
		throw HandlerError(ctx.command + ": " + key + " must be a string");
	}
	return codec::as_string(*value);
}

bool CommandHandler::optional_bool(const ActionContext& ctx, const Arguments& args, const std::string& key, bool fallback) {
	const ArgumentValue* value = codec::find_argument(args, key);
	if (!value) {
		return fallback;
	}
	if (!std::holds_alternative<bool>(*value)) {
		throw HandlerError(ctx.command + ": " + key + " must be a boolean");
	}
	return codec::as_bool(*value, fallback);
}

std::string single_line(std::string text) {
	for (auto& c : text) {
		if (c == '\n' || c == '\r') {
			c = ' ';
		}
	}
	return text;
}

ActionRegistry build_registry(platform::WindowSystem& windows, platform::Notifier& notifier) {
	ActionRegistry registry;
	register_window_actions(registry, windows);
	register_notification_actions(registry, notifier);
	LOG4CPLUS_DEBUG(action_logger(), "Registered " << registry.size() << " command handlers");
	return registry;
}

DispatchOutcome dispatch(const ActionRegistry& registry, const Command& command, std::ostream& out) {
	const CommandHandler* handler = registry.find(command.name);
	if (!handler) {
		LOG4CPLUS_WARN(action_logger(), "Unknown command ignored: " << command.name);
		return DispatchOutcome::Unknown;
	}

	LOG4CPLUS_INFO(action_logger(), "Command: " << command.name);

	ActionContext ctx{command.name, command.arguments};
	std::string result;
	try {
		result = handler->invoke(ctx);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(action_logger(), command.name << " failed: " << exc.what());
		write_line(out, "ERROR: " + single_line(exc.what()));
		return DispatchOutcome::Failed;
	}

	write_line(out, single_line(result));
	return DispatchOutcome::Handled;
}

} // namespace hostbridge::actions
