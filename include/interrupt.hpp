#pragma once

#include <atomic>
#include <mutex>
#include <thread>
#include <boost/asio.hpp>
#include "networking.hpp"

namespace networking {

// Turns SIGINT/SIGTERM into a cancel. Sets the flag the transfer loop checks
// between chunks and closes whatever the main thread is blocked on: the
// listener while it waits for a peer, the session while it transfers.
// After the first signal the default action is restored, so a second
// Ctrl-C kills the process.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::atomic<bool>& cancel_flag);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    // Keeps target registered while the scope lives. A target registered
    // after the signal is cancelled at once.
    template <typename Target>
    class Scope {
    public:
        Scope(InterruptWatcher& watcher, Target& target) : watcher_(watcher) { watcher_.watch(&target); }
        ~Scope() { watcher_.watch(static_cast<Target*>(nullptr)); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        InterruptWatcher& watcher_;
    };

    bool interrupted() const { return cancel_flag_.load(); }

    // Same path a delivered signal takes.
    void interrupt();

private:
    void watch(Listener* listener);
    void watch(Session* session);

    std::atomic<bool>& cancel_flag_;
    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    std::mutex mutex_;
    Listener* listener_ = nullptr;
    Session* session_ = nullptr;
    std::thread thread_;
};

} // namespace networking
