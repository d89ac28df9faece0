#pragma once

#include "action_registry.hpp"

#include <ostream>
#include <string>

namespace hostbridge::actions {

enum class DispatchOutcome {
    Handled, // result line written
    Failed,  // "ERROR: <reason>" line written
    Unknown, // no handler, nothing written
};

/// The fixed command set, built once at startup and never modified afterwards.
ActionRegistry build_registry(platform::WindowSystem& windows, platform::Notifier& notifier);

/**
 * Run one command and write its outcome to @p out.
 *
 * Exactly one line is written for a known command, nothing for an unknown
 * one. Handler exceptions never escape.
 */
DispatchOutcome dispatch(const ActionRegistry& registry, const Command& command, std::ostream& out);

/// Collapse line breaks so a result always occupies one output line.
std::string single_line(std::string text);

} // namespace hostbridge::actions
