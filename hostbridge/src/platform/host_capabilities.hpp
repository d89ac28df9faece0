#pragma once

#include "../protocol.hpp"

#include <cstdint>
#include <string>

namespace hostbridge::platform {

/// Window-manager query used by GetForegroundWindow.
class WindowSystem {
public:
    virtual ~WindowSystem() = default;

    /// On failure returns false and fills @p error with a one-line reason.
    virtual bool foreground_window(uint64_t& handle, std::string& error) = 0;
};

/// Desktop notification primitive used by ShowNotification.
class Notifier {
public:
    virtual ~Notifier() = default;

    /// Blocks until the notification has been handed to the desktop.
    /// On failure returns false and fills @p error with a one-line reason.
    virtual bool show(const NotificationRequest& request, std::string& error) = 0;
};

} // namespace hostbridge::platform
