#pragma once

#include <chrono>
#include <cstddef>

namespace dsfetch {

class CancellationToken;

// Fixed (factor == 1) or capped-exponential delay between attempts.
struct BackoffPolicy {
    std::chrono::milliseconds initial_delay{std::chrono::seconds(5)};
    double factor{2.0};
    std::chrono::milliseconds max_delay{std::chrono::seconds(30)};

    // failures: consecutive failed attempts so far, starting at 1.
    [[nodiscard]] std::chrono::milliseconds delayFor(std::size_t failures) const;
};

class Sleeper {
public:
    virtual ~Sleeper() = default;

    // Returns false if the wait was cut short by cancellation.
    virtual bool sleepFor(std::chrono::milliseconds delay, const CancellationToken& token) = 0;
};

class CancellableSleeper final : public Sleeper {
public:
    bool sleepFor(std::chrono::milliseconds delay, const CancellationToken& token) override;
};

} // namespace dsfetch
