#include "dsfetch/curl_range_fetcher.hpp"

#include "dsfetch/cancellation.hpp"
#include "dsfetch/detail/curl_utils.hpp"
#include "dsfetch/progress.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dsfetch {

class CurlRangeFetcher::Impl {
public:
    explicit Impl(TransferConfig config) : config_(std::move(config)) {}

    FetchResult fetch(const FileDescriptor& descriptor,
                      const std::filesystem::path& local_path,
                      std::uint64_t offset,
                      const CancellationToken& token,
                      ProgressObserver* observer) const {
        detail::CurlHandle curl = detail::makeCurlHandle();
        if (!curl) {
            return FetchResult::failed(ErrorKind::Retryable, "Failed to allocate curl handle");
        }

        AttemptContext ctx;
        ctx.descriptor = &descriptor;
        ctx.local_path = &local_path;
        ctx.offset = offset;
        ctx.token = &token;
        ctx.observer = observer;

        char error_buffer[CURL_ERROR_SIZE] = {0};
        const std::string range = std::to_string(offset) + "-";

        curl_easy_setopt(curl.get(), CURLOPT_URL, descriptor.url.c_str());
        if (offset > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::transferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(config_.chunk_size));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(config_.connect_timeout.count()));
        if (config_.stall_timeout.count() > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(config_.stall_timeout.count()));
        }
        if (config_.attempt_timeout.count() > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                             static_cast<long>(config_.attempt_timeout.count()));
        }

        spdlog::debug("GET {} (offset {})", descriptor.url, offset);
        const CURLcode res = curl_easy_perform(curl.get());

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        // A successful empty body never reaches the write callback. Anything but
        // a 206 replaces the whole file, so a 200 at a nonzero offset still truncates.
        if (res == CURLE_OK && !ctx.file && !ctx.storage_error
            && (offset == 0 || http_status != 206)) {
            if (offset > 0) {
                spdlog::warn("{}: server ignored range request (HTTP {}), restarting from zero",
                             descriptor.filename, http_status);
                ctx.restarted = true;
            }
            ctx.openFile("wb");
        }
        ctx.closeFile();

        if (ctx.storage_error) {
            return FetchResult::failed(ErrorKind::FatalSystem, *ctx.storage_error, http_status);
        }
        if (ctx.range_mismatch) {
            return FetchResult::failed(ErrorKind::RangeNotSatisfiable,
                                       "Server returned an unexpected Content-Range", http_status);
        }
        if (res == CURLE_OK) {
            return FetchResult::completed(ctx.bytes_appended, ctx.restarted);
        }
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            return FetchResult::failed(classifyHttpStatus(http_status),
                                       fmt::format("HTTP {}", http_status), http_status);
        }

        const std::string message = error_buffer[0] != '\0'
            ? std::string(error_buffer)
            : std::string(curl_easy_strerror(res));
        const ErrorKind kind = detail::classifyCurlError(res);
        if (kind == ErrorKind::Cancelled) {
            FetchResult result = FetchResult::failed(ErrorKind::Cancelled, "Cancelled", http_status);
            result.bytes_appended = ctx.bytes_appended;
            result.restarted = ctx.restarted;
            return result;
        }
        if (kind == ErrorKind::Retryable && ctx.bytes_appended > 0) {
            return FetchResult::partial(ctx.bytes_appended, message, ctx.restarted);
        }
        FetchResult result = FetchResult::failed(kind, message, http_status);
        result.restarted = ctx.restarted;
        return result;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct AttemptContext {
        const FileDescriptor* descriptor{nullptr};
        const std::filesystem::path* local_path{nullptr};
        std::uint64_t offset{0};
        const CancellationToken* token{nullptr};
        ProgressObserver* observer{nullptr};

        long status{0};
        std::optional<std::uint64_t> range_start;
        std::unique_ptr<FILE, FileDeleter> file{};
        std::uint64_t bytes_appended{0};
        bool restarted{false};
        bool range_mismatch{false};
        std::optional<std::string> storage_error;

        bool openFile(const char* mode) {
            file.reset(std::fopen(local_path->c_str(), mode));
            if (!file) {
                registerStorageError("Cannot open local file");
                return false;
            }
            return true;
        }

        void closeFile() {
            if (!file) {
                return;
            }
            FILE* fp = file.release();
            const bool flushed = std::fflush(fp) == 0;
            const bool closed = std::fclose(fp) == 0;
            if (!flushed || !closed) {
                registerStorageError("Cannot flush local file");
            }
        }

        void registerStorageError(const char* what) {
            if (!storage_error) {
                storage_error = fmt::format("{}: {} ({})", what, local_path->string(),
                                            std::strerror(errno));
            }
        }
    };

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<AttemptContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return 0;
        }

        const std::string line(buffer, total);
        if (const auto status = detail::parseStatusLine(line)) {
            // New header block (redirect or interim response).
            ctx->status = *status;
            ctx->range_start.reset();
        } else if (const auto start = detail::parseContentRangeStart(line)) {
            ctx->range_start = start;
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<AttemptContext*>(userdata);
        if (!ctx) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (total == 0) {
            return 0;
        }

        if (!ctx->file) {
            const char* mode = "wb";
            if (ctx->offset > 0) {
                if (ctx->status == 206) {
                    if (ctx->range_start && *ctx->range_start != ctx->offset) {
                        ctx->range_mismatch = true;
                        return 0;
                    }
                    mode = "ab";
                } else {
                    spdlog::warn("{}: server ignored range request (HTTP {}), restarting from zero",
                                 ctx->descriptor->filename, ctx->status);
                    ctx->restarted = true;
                }
            }
            if (!ctx->openFile(mode)) {
                return 0;
            }
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file.get());
        ctx->bytes_appended += written;
        if (written != total) {
            ctx->registerStorageError("Failed to write local file");
            return 0;
        }

        if (ctx->observer) {
            const std::uint64_t base = ctx->restarted ? 0 : ctx->offset;
            ctx->observer->onProgress(*ctx->descriptor, base + ctx->bytes_appended,
                                      ctx->descriptor->size);
        }
        return written;
    }

    // Runs between body chunks, so aborting here never splits a write.
    static int transferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* ctx = static_cast<const AttemptContext*>(clientp);
        return (ctx && ctx->token && ctx->token->isCancelled()) ? 1 : 0;
    }

    TransferConfig config_;
};

CurlRangeFetcher::CurlRangeFetcher(TransferConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

CurlRangeFetcher::~CurlRangeFetcher() = default;

FetchResult CurlRangeFetcher::fetch(const FileDescriptor& descriptor,
                                    const std::filesystem::path& local_path,
                                    std::uint64_t offset,
                                    const CancellationToken& token,
                                    ProgressObserver* observer) {
    return impl_->fetch(descriptor, local_path, offset, token, observer);
}

} // namespace dsfetch
