#pragma once

#include <cstddef>
#include <string>

namespace hostbridge::ipc {

enum class ReadStatus {
    Message,    // one complete message was read
    Retry,      // interrupted or unusable read, nothing to process
    OpenFailed, // channel cannot be opened; the server cannot continue
};

/// Source of one-shot messages: each read returns everything one producer wrote.
class MessageChannel {
public:
    virtual ~MessageChannel() = default;
    virtual ReadStatus read_message(std::string& message) = 0;

    /// Makes a blocked (or the next) read_message() return Retry. Async-signal-safe.
    virtual void interrupt() {}

    virtual const std::string& name() const = 0;
};

/**
 * Named pipe reader for producers that open, write one request and close.
 *
 * Every message is read from its own read descriptor, up to end-of-stream.
 * The descriptor for the next message is opened before the current one is
 * closed, so the pipe never loses its last reader between two messages and a
 * producer that connects in that window keeps its data. A producer that
 * connects before end-of-stream was seen shares the current message; callers
 * split such a message on newlines.
 */
class FifoChannel final : public MessageChannel {
public:
    static constexpr size_t kMaxMessageBytes = 1024 * 1024;
    /// Poll period used to notice end-of-stream once a message has started.
    static constexpr int kDrainPollMs = 50;

    /**
     * @param path Filesystem path of the FIFO
     * @param create_if_missing Create the FIFO (mode 0600) when it does not exist
     */
    explicit FifoChannel(std::string path, bool create_if_missing = false);
    ~FifoChannel() override;

    FifoChannel(const FifoChannel&) = delete;
    FifoChannel& operator=(const FifoChannel&) = delete;

    /**
     * Blocks until a producer has written and closed its end.
     *
     * Returns Retry when a signal interrupts the wait before any byte arrived
     * (the descriptor is kept, nothing is lost), when interrupt() was called,
     * or when the message exceeds kMaxMessageBytes.
     */
    ReadStatus read_message(std::string& message) override;

    void interrupt() override;

    const std::string& name() const override { return path_; }

private:
    bool ensure_fifo();
    int open_fifo();
    void drain_wakeups();
    void release_current();

    std::string path_;
    bool create_if_missing_;
    int fd_ = -1;                 // read end for the message being (or about to be) read
    int wake_fds_[2] = {-1, -1};  // self-pipe written by interrupt()
};

} // namespace hostbridge::ipc
