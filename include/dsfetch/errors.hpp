#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace dsfetch {

class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(const std::string& message)
        : std::runtime_error(message) {}
};

// Local storage is unusable (disk full, permission denied, ...). Aborts the run.
class StorageError : public DownloadError {
public:
    StorageError(const std::string& message, std::filesystem::path path)
        : DownloadError(message + ": " + path.string()), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class MetadataError : public DownloadError {
public:
    explicit MetadataError(const std::string& message)
        : DownloadError(message) {}
};

class ConfigError : public DownloadError {
public:
    explicit ConfigError(const std::string& message)
        : DownloadError(message) {}
};

enum class ErrorKind {
    None,
    Retryable,
    FatalFile,
    FatalSystem,
    RangeNotSatisfiable,
    Cancelled,
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// 408, 429 and 5xx are transient; 416 has its own kind; other 4xx are fatal for the file.
[[nodiscard]] ErrorKind classifyHttpStatus(long status) noexcept;

} // namespace dsfetch
