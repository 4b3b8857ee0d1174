#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace dsfetch {

class CancellationToken {
public:
    CancellationToken() = default;
    // Linked token: cancelled together with `parent`, which must outlive it.
    // Cancelling a linked token leaves the parent untouched.
    explicit CancellationToken(const CancellationToken* parent);
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Returns false if cancelled before the timeout elapsed.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    const CancellationToken* parent_{nullptr};
    mutable std::vector<CancellationToken*> children_;
};

// SIGINT/SIGTERM cancel the given token. The token must outlive the process run.
void installSignalHandlers(CancellationToken& token);

} // namespace dsfetch
