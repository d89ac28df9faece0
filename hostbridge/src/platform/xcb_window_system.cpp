#include "xcb_window_system.hpp"

#include "../logger.hpp"

#include <cstdlib>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace hostbridge::platform {

namespace {

// xcb replies and errors are malloc'ed by libxcb
struct FreeDeleter {
    void operator()(void* ptr) const { std::free(ptr); }
};
template <typename T>
using ReplyPtr = std::unique_ptr<T, FreeDeleter>;

constexpr const char* kActiveWindowAtom = "_NET_ACTIVE_WINDOW";

} // namespace

XcbWindowSystem::XcbWindowSystem(std::string display)
    : display_(std::move(display)) {}

bool XcbWindowSystem::connect(std::string& error) {
    if (conn_ && !xcb_connection_has_error(conn_.get())) {
        return true;
    }
    if (conn_) {
        LOG4CPLUS_WARN(platform_logger(), "X connection lost, reconnecting");
        conn_.reset();
    }

    int screen_num = 0;
    ConnectionPtr conn(xcb_connect(display_.empty() ? nullptr : display_.c_str(), &screen_num));
    if (!conn || xcb_connection_has_error(conn.get())) {
        error = "cannot connect to X display " + (display_.empty() ? std::string("$DISPLAY") : display_);
        return false;
    }

    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(xcb_get_setup(conn.get()));
    for (int i = 0; i < screen_num && iter.rem > 0; ++i) {
        xcb_screen_next(&iter);
    }
    if (iter.rem == 0 || !iter.data) {
        error = "X display has no screen " + std::to_string(screen_num);
        return false;
    }
    root_ = iter.data->root;

    auto cookie = xcb_intern_atom(conn.get(), 1, static_cast<uint16_t>(std::strlen(kActiveWindowAtom)), kActiveWindowAtom);
    ReplyPtr<xcb_intern_atom_reply_t> atom(xcb_intern_atom_reply(conn.get(), cookie, nullptr));
    active_window_atom_ = atom ? atom->atom : XCB_ATOM_NONE;
    if (active_window_atom_ == XCB_ATOM_NONE) {
        LOG4CPLUS_INFO(platform_logger(), "Window manager does not support " << kActiveWindowAtom << ", using input focus");
    }

    conn_ = std::move(conn);
    LOG4CPLUS_DEBUG(platform_logger(), "Connected to X display, root=" << root_);
    return true;
}

bool XcbWindowSystem::read_active_window(uint64_t& handle) {
    if (active_window_atom_ == XCB_ATOM_NONE) {
        return false;
    }

    auto cookie = xcb_get_property(conn_.get(), 0, root_, active_window_atom_, XCB_ATOM_WINDOW, 0, 1);
    xcb_generic_error_t* raw_error = nullptr;
    ReplyPtr<xcb_get_property_reply_t> reply(xcb_get_property_reply(conn_.get(), cookie, &raw_error));
    ReplyPtr<xcb_generic_error_t> x_error(raw_error);
    if (x_error) {
        LOG4CPLUS_DEBUG(platform_logger(), "GetProperty " << kActiveWindowAtom << " failed, code=" << static_cast<int>(x_error->error_code));
        return false;
    }
    if (!reply || reply->type != XCB_ATOM_WINDOW || reply->format != 32 ||
        xcb_get_property_value_length(reply.get()) < static_cast<int>(sizeof(xcb_window_t))) {
        return false;
    }

    handle = *static_cast<const xcb_window_t*>(xcb_get_property_value(reply.get()));
    return true;
}

bool XcbWindowSystem::foreground_window(uint64_t& handle, std::string& error) {
    if (!connect(error)) {
        LOG4CPLUS_ERROR(platform_logger(), error);
        return false;
    }

    if (read_active_window(handle)) {
        return true;
    }

    auto cookie = xcb_get_input_focus(conn_.get());
    xcb_generic_error_t* raw_error = nullptr;
    ReplyPtr<xcb_get_input_focus_reply_t> focus(xcb_get_input_focus_reply(conn_.get(), cookie, &raw_error));
    ReplyPtr<xcb_generic_error_t> x_error(raw_error);
    if (!focus || x_error) {
        error = "X server did not report an input focus";
        LOG4CPLUS_ERROR(platform_logger(), error);
        return false;
    }

    handle = focus->focus;
    return true;
}

} // namespace hostbridge::platform
