#include <gtest/gtest.h>

#include "fifo_channel.hpp"
#include "test_helpers.hpp"

#include <sys/stat.h>
#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <thread>

using hostbridge::ipc::FifoChannel;
using hostbridge::ipc::ReadStatus;

namespace {

void ignore_signal(int) {}

// SIGUSR1 without SA_RESTART, so a reader blocked in poll() sees EINTR
class InterruptingSignal {
public:
    InterruptingSignal() {
        struct sigaction sa{};
        sa.sa_handler = ignore_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        ::sigaction(SIGUSR1, &sa, &previous_);
    }
    ~InterruptingSignal() { ::sigaction(SIGUSR1, &previous_, nullptr); }

private:
    struct sigaction previous_{};
};

} // namespace

TEST(FifoChannel, ReadsOneMessagePerOpen) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());

    std::string first;
    std::string second;
    ReadStatus first_status = ReadStatus::Retry;
    ReadStatus second_status = ReadStatus::Retry;

    std::atomic<bool> first_done{false};

    std::thread reader([&] {
        first_status = channel.read_message(first);
        first_done = true;
        second_status = channel.read_message(second);
    });

    ASSERT_TRUE(write_message(fifo.path(), R"({"Command":"GetForegroundWindow"})"));
    // a second producer connecting before end-of-stream would share the first message
    ASSERT_TRUE(wait_until([&] { return first_done.load(); }));
    ASSERT_TRUE(write_message(fifo.path(), "second message"));
    reader.join();

    EXPECT_EQ(first_status, ReadStatus::Message);
    EXPECT_EQ(first, R"({"Command":"GetForegroundWindow"})");
    EXPECT_EQ(second_status, ReadStatus::Message);
    EXPECT_EQ(second, "second message");
}

TEST(FifoChannel, ReassemblesChunkedWrites) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());
    std::string message;
    ReadStatus status = ReadStatus::Retry;

    std::thread reader([&] { status = channel.read_message(message); });

    int fd = open_writer(fifo.path());
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::write(fd, "{\"Command\":", 11), 11);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_EQ(::write(fd, "\"X\"}", 4), 4);
    ::close(fd);
    reader.join();

    EXPECT_EQ(status, ReadStatus::Message);
    EXPECT_EQ(message, "{\"Command\":\"X\"}");
}

TEST(FifoChannel, EmptyWriteYieldsEmptyMessage) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());
    std::string message = "stale";
    ReadStatus status = ReadStatus::Retry;

    std::thread reader([&] { status = channel.read_message(message); });
    ASSERT_TRUE(write_message(fifo.path(), ""));
    reader.join();

    EXPECT_EQ(status, ReadStatus::Message);
    EXPECT_TRUE(message.empty());
}

TEST(FifoChannel, MissingChannelIsFatal) {
    TempFifo fifo;
    FifoChannel channel(fifo.dir() + "/does-not-exist");
    std::string message;

    EXPECT_EQ(channel.read_message(message), ReadStatus::OpenFailed);
}

TEST(FifoChannel, RegularFileIsRejected) {
    TempFifo fifo;
    const std::string file = fifo.dir() + "/plain";
    int fd = ::open(file.c_str(), O_CREAT | O_WRONLY, 0600);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::write(fd, "{}", 2), 2);
    ::close(fd);

    FifoChannel channel(file);
    std::string message;
    EXPECT_EQ(channel.read_message(message), ReadStatus::OpenFailed);
    ::unlink(file.c_str());
}

TEST(FifoChannel, CreatesMissingFifoWhenAsked) {
    TempFifo fifo;
    const std::string path = fifo.dir() + "/created";
    FifoChannel channel(path, true);
    std::string message;
    ReadStatus status = ReadStatus::Retry;

    std::thread reader([&] { status = channel.read_message(message); });

    ASSERT_TRUE(wait_until([&] {
        struct stat st{};
        return ::stat(path.c_str(), &st) == 0 && S_ISFIFO(st.st_mode);
    }));
    ASSERT_TRUE(write_message(path, "hello"));
    reader.join();

    EXPECT_EQ(status, ReadStatus::Message);
    EXPECT_EQ(message, "hello");

    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    ::unlink(path.c_str());
}

TEST(FifoChannel, OversizedMessageIsDropped) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());
    std::string message;
    ReadStatus status = ReadStatus::Message;

    std::thread reader([&] { status = channel.read_message(message); });
    ASSERT_TRUE(write_message(fifo.path(), std::string(FifoChannel::kMaxMessageBytes + 1, 'x')));
    reader.join();

    EXPECT_EQ(status, ReadStatus::Retry);
    EXPECT_TRUE(message.empty());
}

TEST(FifoChannel, InterruptedWaitIsRetriedAndNextMessageIsRead) {
    InterruptingSignal interrupt;
    TempFifo fifo;
    FifoChannel channel(fifo.path());

    std::atomic<bool> done{false};
    ReadStatus status = ReadStatus::Message;
    std::string message;
    std::thread reader([&] {
        status = channel.read_message(message);
        done = true;
    });

    // repeat until the signal lands while the reader waits for a producer
    ASSERT_TRUE(wait_until([&] {
        if (!done) {
            ::pthread_kill(reader.native_handle(), SIGUSR1);
        }
        return done.load();
    }));
    reader.join();
    EXPECT_EQ(status, ReadStatus::Retry);
    EXPECT_TRUE(message.empty());

    std::thread next([&] { status = channel.read_message(message); });
    ASSERT_TRUE(write_message(fifo.path(), "after interrupt"));
    next.join();

    EXPECT_EQ(status, ReadStatus::Message);
    EXPECT_EQ(message, "after interrupt");
}

TEST(FifoChannel, SignalDuringMessageDoesNotTruncateIt) {
    InterruptingSignal interrupt;
    TempFifo fifo;
    FifoChannel channel(fifo.path());

    ReadStatus status = ReadStatus::Retry;
    std::string message;
    std::thread reader([&] { status = channel.read_message(message); });

    int fd = open_writer(fifo.path());
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::write(fd, "{\"Command\":", 11), 11);

    // the producer stalls with its end open while the reader is signalled
    for (int i = 0; i < 10; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ::pthread_kill(reader.native_handle(), SIGUSR1);
    }

    ASSERT_EQ(::write(fd, "\"GetForegroundWindow\"}", 23), 23);
    ::close(fd);
    reader.join();

    EXPECT_EQ(status, ReadStatus::Message);
    EXPECT_EQ(message, R"({"Command":"GetForegroundWindow"})");
}

TEST(FifoChannel, InterruptedWaitKeepsConnectedProducer) {
    InterruptingSignal interrupt;
    TempFifo fifo;
    FifoChannel channel(fifo.path());

    std::atomic<bool> done{false};
    ReadStatus status = ReadStatus::Message;
    std::string message;
    std::thread reader([&] {
        status = channel.read_message(message);
        done = true;
    });

    // connected but silent producer
    int fd = open_writer(fifo.path());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(wait_until([&] {
        if (!done) {
            ::pthread_kill(reader.native_handle(), SIGUSR1);
        }
        return done.load();
    }));
    reader.join();
    EXPECT_EQ(status, ReadStatus::Retry);

    ASSERT_EQ(::write(fd, "late", 4), 4);
    ::close(fd);

    EXPECT_EQ(channel.read_message(message), ReadStatus::Message);
    EXPECT_EQ(message, "late");
}

TEST(FifoChannel, BackToBackProducersAreAllDelivered) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());
    const std::string expected = "first\nsecond\nthird\n";

    // producers may share one message or get one each; no byte may go missing
    std::string received;
    std::thread reader([&] {
        std::string message;
        while (received.size() < expected.size()) {
            if (channel.read_message(message) == ReadStatus::OpenFailed) {
                return;
            }
            received += message;
        }
    });

    ASSERT_TRUE(write_message(fifo.path(), "first\n"));
    ASSERT_TRUE(write_message(fifo.path(), "second\n"));
    ASSERT_TRUE(write_message(fifo.path(), "third\n"));
    reader.join();

    EXPECT_EQ(received, expected);
}

TEST(FifoChannel, InterruptWakesBlockedRead) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());

    std::atomic<bool> done{false};
    ReadStatus status = ReadStatus::Message;
    std::string message;
    std::thread reader([&] {
        status = channel.read_message(message);
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.interrupt();
    ASSERT_TRUE(wait_until([&] { return done.load(); }));
    reader.join();

    EXPECT_EQ(status, ReadStatus::Retry);
    EXPECT_TRUE(message.empty());
}

TEST(FifoChannel, InterruptBeforeReadIsNotLost) {
    TempFifo fifo;
    FifoChannel channel(fifo.path());
    std::string message;

    channel.interrupt();
    EXPECT_EQ(channel.read_message(message), ReadStatus::Retry);
}
