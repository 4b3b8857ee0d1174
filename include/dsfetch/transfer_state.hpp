#pragma once

#include <cstdint>
#include <filesystem>

namespace dsfetch {

// Bytes already persisted for one file. Always re-derived from disk.
struct TransferState {
    std::filesystem::path local_path;
    std::uint64_t bytes_written{0};

    // 0 if the file does not exist, its length otherwise. Throws StorageError.
    [[nodiscard]] static TransferState inspect(const std::filesystem::path& local_path);
};

// Truncates an existing file to zero length. Throws StorageError.
void truncateLocalFile(const std::filesystem::path& local_path);

} // namespace dsfetch
