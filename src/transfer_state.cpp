#include "dsfetch/transfer_state.hpp"

#include "dsfetch/errors.hpp"

#include <system_error>

namespace dsfetch {

TransferState TransferState::inspect(const std::filesystem::path& local_path) {
    std::error_code ec;
    const auto status = std::filesystem::status(local_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw StorageError("Cannot stat local file (" + ec.message() + ")", local_path);
    }
    if (!std::filesystem::exists(status)) {
        return {local_path, 0};
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw StorageError("Local path is not a regular file", local_path);
    }

    const auto size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        throw StorageError("Cannot read local file size (" + ec.message() + ")", local_path);
    }
    return {local_path, static_cast<std::uint64_t>(size)};
}

void truncateLocalFile(const std::filesystem::path& local_path) {
    std::error_code ec;
    if (std::filesystem::exists(local_path, ec)) {
        std::filesystem::resize_file(local_path, 0, ec);
        if (ec) {
            throw StorageError("Cannot truncate local file (" + ec.message() + ")", local_path);
        }
        return;
    }
    if (ec) {
        throw StorageError("Cannot stat local file (" + ec.message() + ")", local_path);
    }
}

} // namespace dsfetch
