#pragma once

#include "host_capabilities.hpp"

#include <string>
#include <vector>

namespace hostbridge::platform {

/**
 * Desktop notifications through the freedesktop `notify-send` tool.
 *
 * The program is executed directly (no shell) and waited for, so the next
 * request is not read until the notification has been submitted.
 */
class NotifySendNotifier final : public Notifier {
public:
    explicit NotifySendNotifier(std::string program = "notify-send", std::string app_name = "hostbridge");

    bool show(const NotificationRequest& request, std::string& error) override;

    const std::string& program() const { return program_; }

private:
    std::string program_;
    std::string app_name_;
};

/// Escape text for the notification body, which servers may render as markup.
std::string escape_markup(const std::string& text);

/// Full argv (program first) for one notification.
std::vector<std::string> build_notify_send_argv(const std::string& program,
                                                const std::string& app_name,
                                                const NotificationRequest& request);

} // namespace hostbridge::platform
