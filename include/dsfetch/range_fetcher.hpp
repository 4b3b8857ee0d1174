#pragma once

#include "errors.hpp"
#include "file_descriptor.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace dsfetch {

class CancellationToken;
class ProgressObserver;

enum class FetchStatus {
    Completed,  // stream ended normally, whole response body consumed
    Partial,    // connection dropped after some bytes were appended
    Failed,
};

struct FetchResult {
    FetchStatus status{FetchStatus::Failed};
    std::uint64_t bytes_appended{0};
    // Server ignored the range and the local file was rewritten from byte 0.
    bool restarted{false};
    ErrorKind error{ErrorKind::None};
    long http_status{0};
    std::string message;

    [[nodiscard]] static FetchResult completed(std::uint64_t bytes, bool restarted = false);
    [[nodiscard]] static FetchResult partial(std::uint64_t bytes, std::string message,
                                             bool restarted = false);
    [[nodiscard]] static FetchResult failed(ErrorKind error, std::string message,
                                            long http_status = 0);
};

// One network attempt: GET descriptor.url from `offset` and append the body to local_path.
// Implementations must allow concurrent calls for different local files.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    [[nodiscard]] virtual FetchResult fetch(const FileDescriptor& descriptor,
                                            const std::filesystem::path& local_path,
                                            std::uint64_t offset,
                                            const CancellationToken& token,
                                            ProgressObserver* observer) = 0;
};

} // namespace dsfetch
