#include "dsfetch/retry_scheduler.hpp"

#include "dsfetch/cancellation.hpp"
#include "dsfetch/checksum.hpp"
#include "dsfetch/errors.hpp"
#include "dsfetch/progress.hpp"
#include "dsfetch/transfer_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace dsfetch {

RetryScheduler::RetryScheduler(RangeFetcher& fetcher,
                               Sleeper& sleeper,
                               const CancellationToken& token,
                               const TransferConfig& config,
                               ProgressObserver* observer)
    : fetcher_(fetcher), sleeper_(sleeper), token_(token), config_(config), observer_(observer) {}

TransferOutcome RetryScheduler::runUntilDone(const FileDescriptor& descriptor,
                                             const std::filesystem::path& local_path) {
    const std::string& name = descriptor.filename;

    std::optional<Checksum> checksum;
    if (descriptor.checksum && !descriptor.checksum->empty()) {
        checksum = Checksum::parse(*descriptor.checksum);
        if (!checksum) {
            spdlog::warn("{}: unsupported checksum '{}', skipping verification",
                         name, *descriptor.checksum);
        }
    }

    Phase phase = Phase::Inspect;
    std::size_t attempts = 0;
    std::size_t failures = 0;
    std::uint64_t bytes = 0;
    // Set once a fetch ended cleanly; cleared whenever the file is reset.
    bool stream_completed = false;
    // Whether the bytes being verified came from the network in this run.
    bool fetched_this_run = false;
    std::string last_error;
    TransferOutcome outcome;

    const auto restartFromZero = [&] {
        truncateLocalFile(local_path);
        bytes = 0;
        stream_completed = false;
    };

    while (phase != Phase::Done) {
        switch (phase) {
        case Phase::Inspect: {
            if (token_.isCancelled()) {
                outcome = TransferOutcome::skipped(name, "cancelled");
                phase = Phase::Done;
                break;
            }

            bytes = TransferState::inspect(local_path).bytes_written;
            if (descriptor.size) {
                const std::uint64_t size = *descriptor.size;
                if (bytes > size) {
                    spdlog::warn("{}: local file larger than expected ({} > {}), redownloading",
                                 name, bytes, size);
                    restartFromZero();
                } else if (bytes == size && (size > 0 || stream_completed)) {
                    if (!fetched_this_run) {
                        spdlog::info("{}: already complete ({})", name, formatSize(bytes));
                    }
                    phase = (checksum && (fetched_this_run || config_.verify_existing))
                        ? Phase::Verify
                        : Phase::Done;
                    if (phase == Phase::Done) {
                        if (fetched_this_run) {
                            spdlog::info("{}: download complete ({})", name, formatSize(bytes));
                        }
                        outcome = TransferOutcome::completed(name, bytes, attempts);
                    }
                    break;
                }
            } else if (stream_completed) {
                phase = checksum ? Phase::Verify : Phase::Done;
                if (phase == Phase::Done) {
                    spdlog::info("{}: download complete ({})", name, formatSize(bytes));
                    outcome = TransferOutcome::completed(name, bytes, attempts);
                }
                break;
            }

            if (bytes > 0) {
                spdlog::info("{}: resuming from {} bytes", name, bytes);
            }
            phase = Phase::Fetch;
            break;
        }

        case Phase::Fetch: {
            ++attempts;
            const FetchResult result = fetcher_.fetch(descriptor, local_path, bytes, token_, observer_);
            if (result.restarted) {
                spdlog::debug("{}: rewritten from byte 0", name);
            }

            switch (result.status) {
            case FetchStatus::Completed:
                fetched_this_run = true;
                if (descriptor.size) {
                    const std::uint64_t now = TransferState::inspect(local_path).bytes_written;
                    if (now < *descriptor.size) {
                        last_error = "stream ended at " + std::to_string(now) + " of "
                            + std::to_string(*descriptor.size) + " bytes";
                        if (result.bytes_appended > 0) {
                            spdlog::info("{}: {}, continuing", name, last_error);
                            failures = 0;
                            phase = Phase::Inspect;
                        } else {
                            ++failures;
                            phase = Phase::Backoff;
                        }
                        break;
                    }
                    if (now > *descriptor.size) {
                        last_error = "size mismatch after download (" + std::to_string(now)
                            + " > " + std::to_string(*descriptor.size) + ")";
                        restartFromZero();
                        ++failures;
                        phase = Phase::Backoff;
                        break;
                    }
                }
                stream_completed = true;
                failures = 0;
                phase = Phase::Inspect;
                break;

            case FetchStatus::Partial:
                fetched_this_run = true;
                spdlog::info("{}: connection dropped after {} new bytes ({}), resuming",
                             name, result.bytes_appended, result.message);
                failures = 0;
                phase = Phase::Inspect;
                break;

            case FetchStatus::Failed:
                last_error = result.message;
                switch (result.error) {
                case ErrorKind::Cancelled:
                    outcome = TransferOutcome::skipped(name, "cancelled");
                    phase = Phase::Done;
                    break;
                case ErrorKind::FatalFile:
                    spdlog::error("{}: {} (not retrying)", name, result.message);
                    outcome = TransferOutcome::failed(name, result.message, attempts);
                    phase = Phase::Done;
                    break;
                case ErrorKind::FatalSystem:
                    throw StorageError(result.message, local_path);
                case ErrorKind::RangeNotSatisfiable:
                    if (!descriptor.size && bytes > 0 && result.http_status == 416) {
                        // Nothing left past our offset: the local copy is the whole file.
                        fetched_this_run = true;
                        stream_completed = true;
                        phase = Phase::Inspect;
                    } else {
                        // A 416 at a known size usually means the declared size is stale;
                        // the restart is a failed attempt, not progress.
                        spdlog::warn("{}: {} at offset {}, restarting from zero",
                                     name, result.message, bytes);
                        restartFromZero();
                        ++failures;
                        phase = Phase::Backoff;
                    }
                    break;
                case ErrorKind::Retryable:
                case ErrorKind::None:
                    ++failures;
                    phase = Phase::Backoff;
                    break;
                }
                break;
            }
            break;
        }

        case Phase::Verify: {
            if (checksum && !verifyChecksum(local_path, *checksum)) {
                last_error = std::string(toString(checksum->algorithm)) + " checksum mismatch";
                spdlog::warn("{}: {}, redownloading from zero", name, last_error);
                restartFromZero();
                if (fetched_this_run) {
                    ++failures;
                    phase = Phase::Backoff;
                } else {
                    phase = Phase::Inspect;
                }
                fetched_this_run = false;
                break;
            }
            spdlog::info("{}: download complete ({})", name, formatSize(bytes));
            outcome = TransferOutcome::completed(name, bytes, attempts);
            phase = Phase::Done;
            break;
        }

        case Phase::Backoff: {
            const auto delay = config_.backoff.delayFor(failures);
            spdlog::warn("{}: {} (attempt {}), retrying in {} ms",
                         name, last_error, attempts, delay.count());
            if (!sleeper_.sleepFor(delay, token_)) {
                outcome = TransferOutcome::skipped(name, "cancelled");
                phase = Phase::Done;
                break;
            }
            phase = Phase::Inspect;
            break;
        }

        case Phase::Done:
            break;
        }
    }

    return outcome;
}

} // namespace dsfetch
