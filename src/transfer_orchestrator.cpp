#include "dsfetch/transfer_orchestrator.hpp"

#include "dsfetch/cancellation.hpp"
#include "dsfetch/errors.hpp"
#include "dsfetch/retry_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace dsfetch {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(RangeFetcher& fetcher,
                                           Sleeper& sleeper,
                                           const CancellationToken& token,
                                           TransferConfig config,
                                           RunOptions options,
                                           ProgressObserver* observer)
    : fetcher_(fetcher),
      sleeper_(sleeper),
      token_(token),
      config_(std::move(config)),
      options_(std::move(options)),
      observer_(observer) {}

bool TransferOrchestrator::matchesFilter(const std::string& filename,
                                         const std::string& keyword,
                                         bool ignore_case) {
    if (keyword.empty()) {
        return true;
    }
    if (ignore_case) {
        return toLower(filename).find(toLower(keyword)) != std::string::npos;
    }
    return filename.find(keyword) != std::string::npos;
}

RunSummary TransferOrchestrator::run(const std::vector<FileDescriptor>& descriptors,
                                     const std::string& filter_keyword) {
    options_.filter_keyword = filter_keyword;
    return run(descriptors);
}

void TransferOrchestrator::prepareDestination() const {
    std::error_code ec;
    std::filesystem::create_directories(options_.destination, ec);
    if (ec) {
        throw StorageError("Failed to create download directory (" + ec.message() + ")",
                           options_.destination);
    }
}

RunSummary TransferOrchestrator::run(const std::vector<FileDescriptor>& descriptors) {
    std::vector<std::optional<TransferOutcome>> results(descriptors.size());
    std::vector<std::size_t> pending;
    std::set<std::string> claimed;

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const auto& descriptor = descriptors[i];
        if (!matchesFilter(descriptor.filename, options_.filter_keyword, options_.ignore_case)) {
            results[i] = TransferOutcome::skipped(descriptor.filename, "filtered");
            continue;
        }
        if (!isValidDescriptor(descriptor)) {
            spdlog::error("Invalid descriptor (name '{}', url '{}')", descriptor.filename, descriptor.url);
            results[i] = TransferOutcome::failed(descriptor.filename, "invalid descriptor", 0);
            continue;
        }
        // Two transfers must never append to the same local file.
        if (!claimed.insert(descriptor.filename).second) {
            results[i] = TransferOutcome::skipped(descriptor.filename, "duplicate filename");
            continue;
        }
        pending.push_back(i);
    }

    spdlog::info("{} of {} files selected for download", pending.size(), descriptors.size());

    if (!pending.empty()) {
        prepareDestination();

        std::mutex results_mutex;
        std::atomic<std::size_t> next{0};
        std::atomic<bool> aborted{false};
        std::exception_ptr failure;
        // Stops sibling transfers once one of them hits a system error.
        CancellationToken run_token(&token_);

        const auto worker = [&]() {
            RetryScheduler scheduler(fetcher_, sleeper_, run_token, config_, observer_);
            while (!aborted.load()) {
                const std::size_t slot = next.fetch_add(1);
                if (slot >= pending.size()) {
                    break;
                }
                const std::size_t index = pending[slot];
                const auto& descriptor = descriptors[index];
                try {
                    auto outcome = scheduler.runUntilDone(
                        descriptor, options_.destination / descriptor.filename);
                    std::lock_guard<std::mutex> lock(results_mutex);
                    results[index] = std::move(outcome);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(results_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                        spdlog::error("{}: aborting the remaining transfers", descriptor.filename);
                    }
                    aborted.store(true);
                    run_token.cancel();
                }
            }
        };

        const std::size_t jobs = std::clamp<std::size_t>(options_.jobs, 1, pending.size());
        std::vector<std::thread> threads;
        threads.reserve(jobs);
        for (std::size_t i = 0; i < jobs; ++i) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    RunSummary summary;
    for (auto& result : results) {
        summary.record(std::move(*result));
    }
    summary.cancelled = token_.isCancelled();
    return summary;
}

} // namespace dsfetch
