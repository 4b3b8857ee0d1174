#pragma once

#include "backoff.hpp"
#include "config.hpp"
#include "file_descriptor.hpp"
#include "range_fetcher.hpp"
#include "transfer_outcome.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace dsfetch {

class CancellationToken;
class ProgressObserver;

struct RunOptions {
    std::filesystem::path destination;
    std::string filter_keyword;
    bool ignore_case{false};
    std::size_t jobs{1};
};

class TransferOrchestrator {
public:
    // fetcher and sleeper are shared by all workers when options.jobs > 1.
    TransferOrchestrator(RangeFetcher& fetcher,
                         Sleeper& sleeper,
                         const CancellationToken& token,
                         TransferConfig config,
                         RunOptions options,
                         ProgressObserver* observer = nullptr);

    // Every descriptor gets exactly one outcome. Throws StorageError if local storage fails.
    [[nodiscard]] RunSummary run(const std::vector<FileDescriptor>& descriptors);
    [[nodiscard]] RunSummary run(const std::vector<FileDescriptor>& descriptors,
                                 const std::string& filter_keyword);

    // Empty keyword matches everything.
    [[nodiscard]] static bool matchesFilter(const std::string& filename,
                                            const std::string& keyword,
                                            bool ignore_case = false);

private:
    void prepareDestination() const;

    RangeFetcher& fetcher_;
    Sleeper& sleeper_;
    const CancellationToken& token_;
    TransferConfig config_;
    RunOptions options_;
    ProgressObserver* observer_;
};

} // namespace dsfetch
