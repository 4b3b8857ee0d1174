#pragma once

#include "dsfetch/errors.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dsfetch::detail {

void ensureCurlInitialized();

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

[[nodiscard]] CurlHandle makeCurlHandle();

// Transport failures are transient unless the request itself is malformed.
[[nodiscard]] ErrorKind classifyCurlError(CURLcode code) noexcept;

// "HTTP/1.1 206 Partial Content" -> 206.
[[nodiscard]] std::optional<long> parseStatusLine(const std::string& line);

// "Content-Range: bytes 100-199/200" -> 100.
[[nodiscard]] std::optional<std::uint64_t> parseContentRangeStart(const std::string& line);

} // namespace dsfetch::detail
