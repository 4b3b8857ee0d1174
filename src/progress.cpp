#include "dsfetch/progress.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dsfetch {

LogProgressObserver::LogProgressObserver(std::chrono::milliseconds interval)
    : interval_(interval) {}

void LogProgressObserver::onProgress(const FileDescriptor& descriptor,
                                     std::uint64_t bytes_written,
                                     std::optional<std::uint64_t> total_size) {
    const auto now = std::chrono::steady_clock::now();
    const bool finished = total_size && bytes_written >= *total_size;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_report_.find(descriptor.filename);
        if (it != last_report_.end() && !finished && now - it->second < interval_) {
            return;
        }
        last_report_[descriptor.filename] = now;
    }

    if (total_size && *total_size > 0) {
        const double ratio = static_cast<double>(bytes_written) / static_cast<double>(*total_size);
        spdlog::info("{}: {}/{} ({:>3}%)",
                     descriptor.filename,
                     formatSize(bytes_written),
                     formatSize(*total_size),
                     static_cast<int>(ratio * 100.0));
    } else {
        spdlog::info("{}: {}", descriptor.filename, formatSize(bytes_written));
    }
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace dsfetch
