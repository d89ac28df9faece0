#pragma once

#include "action/action_registry.hpp"
#include "fifo_channel.hpp"

#include <atomic>
#include <cstdint>
#include <ostream>

namespace hostbridge {

struct ServerStats {
    uint64_t messages = 0;  // complete messages read from the channel
    uint64_t requests = 0;  // requests found in those messages
    uint64_t retries = 0;   // interrupted or dropped reads
    uint64_t malformed = 0;
    uint64_t unknown = 0;
    uint64_t handled = 0;
    uint64_t failed = 0;
};

/**
 * Read, decode and dispatch requests one at a time, forever.
 *
 * Malformed and unknown requests are discarded, handler failures become an
 * "ERROR:" line, interrupted reads are retried. Only a channel that cannot
 * be opened, or stop(), ends run().
 */
class CommandServer {
public:
    /**
     * @param channel Message source, reopened for every request
     * @param registry Immutable command table
     * @param out Result stream, one line per handled command
     * @param strict Also write an "ERROR:" line for malformed requests
     */
    CommandServer(ipc::MessageChannel& channel,
                  const actions::ActionRegistry& registry,
                  std::ostream& out,
                  bool strict = false);

    /// Blocking loop. Returns 0 after stop(), 1 when the channel cannot be opened.
    int run();

    /**
     * One read/decode/dispatch cycle. A message holding several
     * newline-delimited requests has each of them dispatched, in order.
     * Returns false on a fatal channel error.
     */
    bool run_once();

    /**
     * Async-signal-safe. Wakes a read blocked on the channel, which then
     * returns Retry; run() returns once the request in progress is answered.
     * A partially received message is abandoned.
     */
    void stop() {
        stop_requested_.store(true);
        channel_.interrupt();
    }

    bool is_running() const { return running_.load(); }

    ServerStats stats() const;

private:
    void process_request(const std::string& request);

    ipc::MessageChannel& channel_;
    const actions::ActionRegistry& registry_;
    std::ostream& out_;
    bool strict_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::atomic<uint64_t> messages_{0};
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> unknown_{0};
    std::atomic<uint64_t> handled_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace hostbridge
