#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <thread>
#include "interrupt.hpp"
#include "orchestrator.hpp"
#include "protocol/errors.hpp"
#include "test_streams.hpp"

using networking::InterruptWatcher;
using testing_support::RecordingLogger;
using testing_support::make_loopback_pair;

class InterruptTest : public ::testing::Test {
protected:
    std::atomic<bool> cancel_{false};
    RecordingLogger logger_;
};

TEST_F(InterruptTest, SignalStopsWaitingForPeer)
{
    InterruptWatcher watcher(cancel_);
    networking::Listener listener(0, "127.0.0.1");
    InterruptWatcher::Scope<networking::Listener> scope(watcher, listener);

    std::thread raiser([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        std::raise(SIGINT);
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(listener.accept(logger_), protocol::TransferCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(cancel_.load());
    EXPECT_TRUE(watcher.interrupted());
    raiser.join();
}

TEST_F(InterruptTest, InterruptUnblocksHeaderRead)
{
    auto pair = make_loopback_pair(logger_);
    InterruptWatcher watcher(cancel_);
    InterruptWatcher::Scope<networking::Session> scope(watcher, *pair.server);

    std::thread interrupter([&watcher]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        watcher.interrupt();
    });

    transfer::FileReceiver receiver(*pair.server, logger_);
    EXPECT_THROW(receiver.receive(), protocol::ConnectionLost);
    EXPECT_TRUE(cancel_.load());
    interrupter.join();
}

TEST_F(InterruptTest, TargetRegisteredAfterInterruptIsCancelledAtOnce)
{
    InterruptWatcher watcher(cancel_);
    watcher.interrupt();

    networking::Listener listener(0, "127.0.0.1");
    InterruptWatcher::Scope<networking::Listener> scope(watcher, listener);
    EXPECT_THROW(listener.accept(logger_), protocol::TransferCancelled);
}
