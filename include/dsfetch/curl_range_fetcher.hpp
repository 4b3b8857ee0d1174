#pragma once

#include "config.hpp"
#include "range_fetcher.hpp"

#include <memory>

namespace dsfetch {

// libcurl-backed fetcher. Sends "Range: bytes=N-" when offset > 0 and restarts the
// local file from zero when the server answers 200 instead of 206.
class CurlRangeFetcher final : public RangeFetcher {
public:
    explicit CurlRangeFetcher(TransferConfig config);
    ~CurlRangeFetcher() override;

    [[nodiscard]] FetchResult fetch(const FileDescriptor& descriptor,
                                    const std::filesystem::path& local_path,
                                    std::uint64_t offset,
                                    const CancellationToken& token,
                                    ProgressObserver* observer) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dsfetch
