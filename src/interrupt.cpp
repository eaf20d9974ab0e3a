#include "interrupt.hpp"
#include <csignal>

namespace networking {

InterruptWatcher::InterruptWatcher(std::atomic<bool>& cancel_flag)
    : cancel_flag_(cancel_flag), signals_(io_context_, SIGINT, SIGTERM) {
    signals_.async_wait([this](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        boost::system::error_code ignored;
        signals_.clear(ignored);
        interrupt();
    });
    thread_ = std::thread([this]() { io_context_.run(); });
}

InterruptWatcher::~InterruptWatcher() {
    io_context_.stop();
    thread_.join();
}

void InterruptWatcher::interrupt() {
    cancel_flag_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener_) {
        listener_->cancel();
    }
    if (session_) {
        session_->cancel();
    }
}

void InterruptWatcher::watch(Listener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
    if (listener_ && interrupted()) {
        listener_->cancel();
    }
}

void InterruptWatcher::watch(Session* session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
    if (session_ && interrupted()) {
        session_->cancel();
    }
}

} // namespace networking
