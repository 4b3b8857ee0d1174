#pragma once

#include "file_descriptor.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <mutex>

namespace dsfetch {

// Called from worker threads; implementations must be thread-safe.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    virtual void onProgress(const FileDescriptor& descriptor,
                            std::uint64_t bytes_written,
                            std::optional<std::uint64_t> total_size) = 0;
};

// Logs at most one line per file per interval, plus one when a file reaches its size.
class LogProgressObserver final : public ProgressObserver {
public:
    explicit LogProgressObserver(std::chrono::milliseconds interval = std::chrono::seconds(1));

    void onProgress(const FileDescriptor& descriptor,
                    std::uint64_t bytes_written,
                    std::optional<std::uint64_t> total_size) override;

private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_report_;
};

[[nodiscard]] std::string formatSize(std::uint64_t bytes);

} // namespace dsfetch
