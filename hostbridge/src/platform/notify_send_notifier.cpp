#include "notify_send_notifier.hpp"

#include "../logger.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace hostbridge::platform {

namespace {

constexpr int kExecFailedStatus = 127;

constexpr const char* kSoundHint = "--hint=string:sound-name:message-new-instant";
constexpr const char* kSilentHint = "--hint=boolean:suppress-sound:true";

} // namespace

std::string escape_markup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::vector<std::string> build_notify_send_argv(const std::string& program,
                                                const std::string& app_name,
                                                const NotificationRequest& request) {
    std::vector<std::string> argv;
    argv.push_back(program);
    if (!app_name.empty()) {
        argv.push_back("--app-name=" + app_name);
    }
    argv.push_back(request.sound ? kSoundHint : kSilentHint);
    // summary is plain text in the notification protocol, only the body may carry markup
    argv.push_back("--");
    argv.push_back(request.title);
    argv.push_back(escape_markup(request.message));
    return argv;
}

NotifySendNotifier::NotifySendNotifier(std::string program, std::string app_name)
    : program_(std::move(program)),
      app_name_(std::move(app_name)) {}

bool NotifySendNotifier::show(const NotificationRequest& request, std::string& error) {
    std::vector<std::string> args = build_notify_send_argv(program_, app_name_, request);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        LOG4CPLUS_ERROR(platform_logger(), error);
        return false;
    }

    if (pid == 0) {
        // stdout belongs to the command protocol
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(kExecFailedStatus);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid failed: ") + std::strerror(errno);
            LOG4CPLUS_ERROR(platform_logger(), error);
            return false;
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            LOG4CPLUS_DEBUG(platform_logger(), "Notification shown: " << request.title);
            return true;
        }
        if (code == kExecFailedStatus) {
            error = "cannot execute " + program_;
        } else {
            error = program_ + " exited with status " + std::to_string(code);
        }
    } else if (WIFSIGNALED(status)) {
        error = program_ + " killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        error = program_ + " ended abnormally";
    }

    LOG4CPLUS_ERROR(platform_logger(), "Notification failed: " << error);
    return false;
}

} // namespace hostbridge::platform
