#include "dsfetch/file_descriptor.hpp"

#include <filesystem>

namespace dsfetch {

bool isSafeFilename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    if (filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
        return false;
    }
    if (filename.find('\0') != std::string::npos) {
        return false;
    }
    return !std::filesystem::path{filename}.is_absolute();
}

bool isValidDescriptor(const FileDescriptor& descriptor) {
    return !descriptor.url.empty() && isSafeFilename(descriptor.filename);
}

} // namespace dsfetch
