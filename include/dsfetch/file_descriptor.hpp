#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dsfetch {

struct FileDescriptor {
    std::string url;
    std::string filename;
    std::optional<std::uint64_t> size;
    std::optional<std::string> checksum;  // e.g. "md5:2942bfab..."
};

// True when filename is a plain name that stays inside the destination directory.
[[nodiscard]] bool isSafeFilename(const std::string& filename);

[[nodiscard]] bool isValidDescriptor(const FileDescriptor& descriptor);

struct RecordMetadata {
    std::string title;
    std::string record_id;
    std::vector<FileDescriptor> files;
};

} // namespace dsfetch
