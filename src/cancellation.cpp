#include "dsfetch/cancellation.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

namespace dsfetch {

CancellationToken::CancellationToken(const CancellationToken* parent) : parent_(parent) {
    if (!parent_) {
        return;
    }
    std::lock_guard<std::mutex> lock(parent_->mutex_);
    if (parent_->isCancelled()) {
        cancelled_.store(true, std::memory_order_release);
    } else {
        parent_->children_.push_back(this);
    }
}

CancellationToken::~CancellationToken() {
    if (!parent_) {
        return;
    }
    std::lock_guard<std::mutex> lock(parent_->mutex_);
    auto& siblings = parent_->children_;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), this), siblings.end());
}

void CancellationToken::cancel() {
    {
        // Locks are always taken parent before child.
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
        for (CancellationToken* child : children_) {
            child->cancel();
        }
    }
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, timeout, [this] { return isCancelled(); });
}

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void onTerminationSignal(int sig) {
    g_signal_received = sig;
    // A second Ctrl-C terminates immediately.
    std::signal(sig, SIG_DFL);
}

} // namespace

void installSignalHandlers(CancellationToken& token) {
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);

    // The handler only sets a flag; the watcher does the locking.
    std::thread([&token] {
        while (g_signal_received == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        spdlog::warn("Received signal {}, finishing current attempts...",
                     static_cast<int>(g_signal_received));
        token.cancel();
    }).detach();
}

} // namespace dsfetch
