#include "action/action.hpp"
#include "command_server.hpp"
#include "fifo_channel.hpp"
#include "logger.hpp"
#include "platform/notify_send_notifier.hpp"
#include "platform/xcb_window_system.hpp"
#include "server_options.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <iostream>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

hostbridge::CommandServer* g_server = nullptr;

void on_stop_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

// stop() wakes the channel itself; no SA_RESTART so other blocking calls see EINTR too.
bool install_stop_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return ::sigaction(SIGINT, &sa, nullptr) == 0 && ::sigaction(SIGTERM, &sa, nullptr) == 0;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    hostbridge::ServerOptions options;
    std::string error;
    if (!hostbridge::parse_options(argc, argv, options, error)) {
        std::cerr << "hostbridge: " << error << std::endl;
        hostbridge::print_usage(std::cerr, argv[0]);
        return 2;
    }

    if (options.show_help) {
        hostbridge::print_usage(std::cout, argv[0]);
        return 0;
    }

    if (options.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (options.pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(options.config_path);

    LOG4CPLUS_INFO(core_logger(), "hostbridge starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Channel: " << options.channel_path);
    LOG4CPLUS_INFO(core_logger(), "Notifications via: " << options.notify_program);
    LOG4CPLUS_INFO(core_logger(), "Malformed requests: " << (options.strict ? "reported" : "ignored"));
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (options.pdeathsig ? "enabled" : "disabled"));

    // A caller that stops reading our stdout must not kill the server
    ::signal(SIGPIPE, SIG_IGN);

    hostbridge::platform::XcbWindowSystem window_system;
    hostbridge::platform::NotifySendNotifier notifier(options.notify_program, options.app_name);
    const hostbridge::actions::ActionRegistry registry =
        hostbridge::actions::build_registry(window_system, notifier);

    hostbridge::ipc::FifoChannel channel(options.channel_path, options.create_channel);
    hostbridge::CommandServer server(channel, registry, std::cout, options.strict);

    g_server = &server;
    if (!install_stop_handlers()) {
        LOG4CPLUS_WARN(core_logger(), "Failed to install signal handlers");
    }

    int status = server.run();
    g_server = nullptr;
    return status;
}
