#include "dsfetch/backoff.hpp"

#include "dsfetch/cancellation.hpp"

#include <algorithm>
#include <cmath>

namespace dsfetch {

std::chrono::milliseconds BackoffPolicy::delayFor(std::size_t failures) const {
    if (failures <= 1 || factor <= 1.0) {
        return std::min(initial_delay, max_delay);
    }

    // Exponent is clamped so the double never overflows on long outages.
    const double exponent = static_cast<double>(std::min<std::size_t>(failures - 1, 64));
    const double scaled = static_cast<double>(initial_delay.count()) * std::pow(factor, exponent);
    if (scaled >= static_cast<double>(max_delay.count())) {
        return max_delay;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
}

bool CancellableSleeper::sleepFor(std::chrono::milliseconds delay, const CancellationToken& token) {
    if (token.isCancelled()) {
        return false;
    }
    return token.waitFor(delay);
}

} // namespace dsfetch
