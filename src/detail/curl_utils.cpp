#include "dsfetch/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace dsfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    return CurlHandle{curl_easy_init()};
}

ErrorKind classifyCurlError(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return ErrorKind::None;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_TOO_MANY_REDIRECTS:
            return ErrorKind::FatalFile;
        case CURLE_OUT_OF_MEMORY:
            return ErrorKind::FatalSystem;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorKind::Cancelled;
        default:
            // Timeouts, resets, DNS and TLS hiccups, short reads.
            return ErrorKind::Retryable;
    }
}

std::optional<long> parseStatusLine(const std::string& line) {
    if (line.compare(0, 5, "HTTP/") != 0) {
        return std::nullopt;
    }
    const auto space = line.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }
    char* end = nullptr;
    const long code = std::strtol(line.c_str() + space + 1, &end, 10);
    if (end == line.c_str() + space + 1 || code < 100 || code > 999) {
        return std::nullopt;
    }
    return code;
}

std::optional<std::uint64_t> parseContentRangeStart(const std::string& line) {
    static const std::string name = "content-range:";
    if (line.size() < name.size()) {
        return std::nullopt;
    }
    std::string lower(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(name.size()));
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower != name) {
        return std::nullopt;
    }

    const auto unit = line.find("bytes", name.size());
    if (unit == std::string::npos) {
        return std::nullopt;
    }
    std::size_t pos = unit + 5;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (pos >= line.size() || !std::isdigit(static_cast<unsigned char>(line[pos]))) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::strtoull(line.c_str() + pos, nullptr, 10));
}

} // namespace dsfetch::detail
