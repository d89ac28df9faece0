#pragma once

#include "../protocol.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace hostbridge::actions {

/// Raised by a handler when its command cannot be carried out.
/// The dispatcher turns it into an "ERROR: <what>" output line.
class HandlerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ActionContext {
	const std::string& command;
	const std::optional<Arguments>& arguments;
};

class CommandHandler {
public:
	virtual ~CommandHandler() = default;
	virtual const char* name() const = 0;

	/// Returns the single-line plaintext result, or throws HandlerError.
	virtual std::string invoke(const ActionContext& ctx) const = 0;

protected:
	static const Arguments& require_arguments(const ActionContext& ctx);
	static std::string require_string(const ActionContext& ctx, const Arguments& args, const std::string& key);
	static bool optional_bool(const ActionContext& ctx, const Arguments& args, const std::string& key, bool fallback);
};

} // namespace hostbridge::actions
