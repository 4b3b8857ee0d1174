#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace dsfetch {

enum class DigestAlgorithm {
    Md5,
    Sha1,
    Sha256,
    Sha512,
};

struct Checksum {
    DigestAlgorithm algorithm{DigestAlgorithm::Md5};
    std::string hex;  // lower case

    // "md5:<hex>", "sha256:<hex>", or bare hex whose length implies the algorithm.
    [[nodiscard]] static std::optional<Checksum> parse(const std::string& text);
};

[[nodiscard]] const char* toString(DigestAlgorithm algorithm) noexcept;

// Streams the file through OpenSSL EVP. Throws StorageError if it cannot be read.
[[nodiscard]] std::string computeFileDigest(const std::filesystem::path& path,
                                            DigestAlgorithm algorithm);

[[nodiscard]] bool verifyChecksum(const std::filesystem::path& path, const Checksum& expected);

} // namespace dsfetch
