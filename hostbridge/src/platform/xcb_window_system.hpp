#pragma once

#include "host_capabilities.hpp"

#include <xcb/xcb.h>

#include <memory>
#include <string>

namespace hostbridge::platform {

/**
 * Foreground window lookup through the X server.
 *
 * Reads the EWMH _NET_ACTIVE_WINDOW property of the root window and falls back
 * to the input focus when the window manager does not publish it. The
 * connection is opened on first use and reopened after it breaks.
 *
 * @param display X display name; empty means $DISPLAY
 */
class XcbWindowSystem final : public WindowSystem {
public:
    explicit XcbWindowSystem(std::string display = "");

    bool foreground_window(uint64_t& handle, std::string& error) override;

private:
    struct ConnectionDeleter {
        void operator()(xcb_connection_t* conn) const {
            if (conn) xcb_disconnect(conn);
        }
    };
    using ConnectionPtr = std::unique_ptr<xcb_connection_t, ConnectionDeleter>;

    bool connect(std::string& error);
    bool read_active_window(uint64_t& handle);

    std::string display_;
    ConnectionPtr conn_;
    xcb_window_t root_ = XCB_WINDOW_NONE;
    xcb_atom_t active_window_atom_ = XCB_ATOM_NONE;
};

} // namespace hostbridge::platform
