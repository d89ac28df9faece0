#include "fifo_channel.hpp"

#include "logger.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <log4cplus/loggingmacros.h>

namespace hostbridge::ipc {

FifoChannel::FifoChannel(std::string path, bool create_if_missing)
    : path_(std::move(path)),
      create_if_missing_(create_if_missing) {
    if (::pipe2(wake_fds_, O_NONBLOCK | O_CLOEXEC) < 0) {
        LOG4CPLUS_WARN(channel_logger(), "No wake pipe for " << path_ << ": " << std::strerror(errno)
                       << "; stop requests wait for the next producer");
        wake_fds_[0] = wake_fds_[1] = -1;
    }
}

FifoChannel::~FifoChannel() {
    for (int fd : {fd_, wake_fds_[0], wake_fds_[1]}) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}

bool FifoChannel::ensure_fifo() {
    struct stat st{};
    if (::stat(path_.c_str(), &st) == 0) {
        return true;
    }
    if (errno != ENOENT) {
        return true; // open() reports the real problem
    }

    if (::mkfifo(path_.c_str(), 0600) < 0 && errno != EEXIST) {
        LOG4CPLUS_ERROR(channel_logger(), "mkfifo " << path_ << " failed: " << std::strerror(errno));
        return false;
    }
    LOG4CPLUS_INFO(channel_logger(), "Created channel " << path_);
    return true;
}

int FifoChannel::open_fifo() {
    if (create_if_missing_ && !ensure_fifo()) {
        return -1;
    }

    // non-blocking: opening the read end must not wait for a producer, poll() does
    int fd;
    do {
        fd = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        LOG4CPLUS_ERROR(channel_logger(), "Cannot open channel " << path_ << ": " << std::strerror(errno));
        return -1;
    }

    struct stat st{};
    if (::fstat(fd, &st) < 0 || !S_ISFIFO(st.st_mode)) {
        LOG4CPLUS_ERROR(channel_logger(), "Channel " << path_ << " is not a FIFO");
        ::close(fd);
        return -1;
    }
    return fd;
}

void FifoChannel::release_current() {
    // the next reader exists before this one goes away
    int next = open_fifo();
    ::close(fd_);
    fd_ = next;
}

void FifoChannel::drain_wakeups() {
    char buffer[64];
    while (::read(wake_fds_[0], buffer, sizeof(buffer)) > 0) {
    }
}

void FifoChannel::interrupt() {
    if (wake_fds_[1] < 0) {
        return;
    }
    int saved_errno = errno;
    const char byte = 1;
    // EAGAIN means the pipe is full, a wakeup is already pending
    while (::write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
    }
    errno = saved_errno;
}

ReadStatus FifoChannel::read_message(std::string& message) {
    message.clear();

    if (fd_ < 0) {
        fd_ = open_fifo();
        if (fd_ < 0) {
            return ReadStatus::OpenFailed;
        }
    }

    bool oversized = false;
    bool hung_up = false;
    size_t total = 0;
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n > 0) {
            total += static_cast<size_t>(n);
            if (total > kMaxMessageBytes) {
                // keep draining so the producer can finish its write
                if (!oversized) {
                    message.clear();
                    message.shrink_to_fit();
                    oversized = true;
                }
                continue;
            }
            message.append(buffer, static_cast<size_t>(n));
            continue;
        }
        // 0 before anything arrived only means no producer has connected yet
        if (n == 0 && (total > 0 || hung_up)) {
            break;
        }
        if (n < 0 && errno != EAGAIN && errno != EINTR) {
            LOG4CPLUS_WARN(channel_logger(), "Read from " << path_ << " failed: " << std::strerror(errno));
            message.clear();
            ::close(fd_);
            fd_ = -1;
            return ReadStatus::Retry;
        }

        // A producer that connected before this descriptor was opened raises no
        // POLLHUP when it leaves, so once data flows the read is retried periodically.
        struct pollfd fds[2] = {
            {fd_, POLLIN, 0},
            {wake_fds_[0], POLLIN, 0},
        };
        int ready = ::poll(fds, 2, total > 0 ? kDrainPollMs : -1);
        if (ready < 0) {
            if (errno != EINTR) {
                LOG4CPLUS_WARN(channel_logger(), "Waiting on " << path_ << " failed: " << std::strerror(errno));
                message.clear();
                ::close(fd_);
                fd_ = -1;
                return ReadStatus::Retry;
            }
            if (total == 0) {
                LOG4CPLUS_DEBUG(channel_logger(), "Wait on " << path_ << " interrupted, retrying");
                return ReadStatus::Retry;
            }
            // bytes already consumed belong to this message, keep reading it
            continue;
        }
        if (fds[1].revents & POLLIN) {
            drain_wakeups();
            if (total > 0) {
                LOG4CPLUS_WARN(channel_logger(), "Abandoning partial " << total << " byte message on " << path_);
            }
            message.clear();
            return ReadStatus::Retry;
        }
        if (fds[0].revents & (POLLHUP | POLLERR)) {
            hung_up = true;
        }
    }

    release_current();

    if (oversized) {
        LOG4CPLUS_WARN(channel_logger(), "Dropped " << total << " byte message, limit is " << kMaxMessageBytes);
        message.clear();
        return ReadStatus::Retry;
    }

    LOG4CPLUS_DEBUG(channel_logger(), "Read " << message.size() << " bytes from " << path_);
    return ReadStatus::Message;
}

} // namespace hostbridge::ipc
