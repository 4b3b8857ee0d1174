#pragma once

namespace dsfetch {

struct LogOptions {
    bool verbose{false};
    bool quiet{false};
};

void setupLogging(const LogOptions& options);

} // namespace dsfetch
