#pragma once

#include "backoff.hpp"
#include "config.hpp"
#include "file_descriptor.hpp"
#include "range_fetcher.hpp"
#include "transfer_outcome.hpp"

#include <filesystem>

namespace dsfetch {

class CancellationToken;
class ProgressObserver;

// Drives one file to a terminal outcome. Retryable failures are retried without limit,
// fatal HTTP errors end the file, local storage errors throw StorageError.
class RetryScheduler {
public:
    RetryScheduler(RangeFetcher& fetcher,
                   Sleeper& sleeper,
                   const CancellationToken& token,
                   const TransferConfig& config,
                   ProgressObserver* observer = nullptr);

    [[nodiscard]] TransferOutcome runUntilDone(const FileDescriptor& descriptor,
                                               const std::filesystem::path& local_path);

private:
    enum class Phase {
        Inspect,
        Fetch,
        Verify,
        Backoff,
        Done,
    };

    RangeFetcher& fetcher_;
    Sleeper& sleeper_;
    const CancellationToken& token_;
    const TransferConfig& config_;
    ProgressObserver* observer_;
};

} // namespace dsfetch
