#include "command_server.hpp"

#include "action/action.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hostbridge {

CommandServer::CommandServer(ipc::MessageChannel& channel,
                             const actions::ActionRegistry& registry,
                             std::ostream& out,
                             bool strict)
    : channel_(channel),
      registry_(registry),
      out_(out),
      strict_(strict) {}

int CommandServer::run() {
    running_ = true;
    LOG4CPLUS_INFO(core_logger(), "Waiting for requests on " << channel_.name());

    int status = 0;
    while (!stop_requested_.load()) {
        if (!run_once()) {
            LOG4CPLUS_FATAL(core_logger(), "Channel " << channel_.name() << " is unavailable, exiting");
            status = 1;
            break;
        }
    }

    running_ = false;
    ServerStats s = stats();
    LOG4CPLUS_INFO(core_logger(), "Command server stopped: messages=" << s.messages
                   << " requests=" << s.requests
                   << " handled=" << s.handled << " failed=" << s.failed
                   << " unknown=" << s.unknown << " malformed=" << s.malformed
                   << " retries=" << s.retries);
    return status;
}

bool CommandServer::run_once() {
    std::string message;
    switch (channel_.read_message(message)) {
        case ipc::ReadStatus::OpenFailed:
            return false;
        case ipc::ReadStatus::Retry:
            ++retries_;
            return true;
        case ipc::ReadStatus::Message:
            break;
    }
    ++messages_;

    for (const std::string& request : codec::split_requests(message)) {
        process_request(request);
    }
    return true;
}

void CommandServer::process_request(const std::string& request) {
    ++requests_;

    Command command;
    try {
        command = codec::decode_command(request);
    } catch (const codec::DecodeError& exc) {
        ++malformed_;
        LOG4CPLUS_WARN(core_logger(), "Discarding malformed request: " << exc.what());
        if (strict_) {
            out_ << "ERROR: malformed request: " << actions::single_line(exc.what()) << '\n';
            out_.flush();
            out_.clear();
        }
        return;
    }

    switch (actions::dispatch(registry_, command, out_)) {
        case actions::DispatchOutcome::Handled:
            ++handled_;
            break;
        case actions::DispatchOutcome::Failed:
            ++failed_;
            break;
        case actions::DispatchOutcome::Unknown:
            ++unknown_;
            break;
    }
}

ServerStats CommandServer::stats() const {
    ServerStats s;
    s.messages = messages_.load();
    s.requests = requests_.load();
    s.retries = retries_.load();
    s.malformed = malformed_.load();
    s.unknown = unknown_.load();
    s.handled = handled_.load();
    s.failed = failed_.load();
    return s;
}

} // namespace hostbridge
