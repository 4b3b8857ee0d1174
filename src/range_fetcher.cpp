#include "dsfetch/range_fetcher.hpp"

#include <utility>

namespace dsfetch {

FetchResult FetchResult::completed(std::uint64_t bytes, bool restarted) {
    FetchResult result;
    result.status = FetchStatus::Completed;
    result.bytes_appended = bytes;
    result.restarted = restarted;
    return result;
}

FetchResult FetchResult::partial(std::uint64_t bytes, std::string message, bool restarted) {
    FetchResult result;
    result.status = FetchStatus::Partial;
    result.bytes_appended = bytes;
    result.restarted = restarted;
    result.error = ErrorKind::Retryable;
    result.message = std::move(message);
    return result;
}

FetchResult FetchResult::failed(ErrorKind error, std::string message, long http_status) {
    FetchResult result;
    result.status = FetchStatus::Failed;
    result.error = error;
    result.http_status = http_status;
    result.message = std::move(message);
    return result;
}

} // namespace dsfetch
