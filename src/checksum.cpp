#include "dsfetch/checksum.hpp"

#include "dsfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace dsfetch {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

const EVP_MD* evpDigest(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Md5:    return EVP_md5();
        case DigestAlgorithm::Sha1:   return EVP_sha1();
        case DigestAlgorithm::Sha256: return EVP_sha256();
        case DigestAlgorithm::Sha512: return EVP_sha512();
    }
    return nullptr;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isHex(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

std::optional<Checksum> Checksum::parse(const std::string& text) {
    std::string algo;
    std::string digest = text;
    if (const auto colon = text.find(':'); colon != std::string::npos) {
        algo = toLower(text.substr(0, colon));
        digest = text.substr(colon + 1);
    }
    digest = toLower(digest);
    if (!isHex(digest)) {
        return std::nullopt;
    }

    Checksum result;
    result.hex = digest;
    if (algo.empty()) {
        switch (digest.size()) {
            case 32:  result.algorithm = DigestAlgorithm::Md5; break;
            case 40:  result.algorithm = DigestAlgorithm::Sha1; break;
            case 64:  result.algorithm = DigestAlgorithm::Sha256; break;
            case 128: result.algorithm = DigestAlgorithm::Sha512; break;
            default:  return std::nullopt;
        }
        return result;
    }

    if (algo == "md5") {
        result.algorithm = DigestAlgorithm::Md5;
    } else if (algo == "sha1") {
        result.algorithm = DigestAlgorithm::Sha1;
    } else if (algo == "sha256") {
        result.algorithm = DigestAlgorithm::Sha256;
    } else if (algo == "sha512") {
        result.algorithm = DigestAlgorithm::Sha512;
    } else {
        return std::nullopt;
    }
    return result;
}

const char* toString(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::Md5:    return "md5";
        case DigestAlgorithm::Sha1:   return "sha1";
        case DigestAlgorithm::Sha256: return "sha256";
        case DigestAlgorithm::Sha512: return "sha512";
    }
    return "unknown";
}

std::string computeFileDigest(const std::filesystem::path& path, DigestAlgorithm algorithm) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StorageError("Cannot open file for checksum", path);
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw DownloadError("Failed to allocate OpenSSL digest context");
    }
    if (EVP_DigestInit_ex(md_ctx.get(), evpDigest(algorithm), nullptr) != 1) {
        throw DownloadError(std::string("Failed to initialise ") + toString(algorithm) + " digest");
    }

    char buffer[65536];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw DownloadError("OpenSSL digest update failed");
        }
        if (file.eof()) {
            break;
        }
    }
    if (file.bad()) {
        throw StorageError("Read error while computing checksum", path);
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw DownloadError("OpenSSL digest finalisation failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

bool verifyChecksum(const std::filesystem::path& path, const Checksum& expected) {
    return computeFileDigest(path, expected.algorithm) == expected.hex;
}

} // namespace dsfetch
