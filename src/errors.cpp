#include "dsfetch/errors.hpp"

namespace dsfetch {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::Retryable:           return "retryable";
        case ErrorKind::FatalFile:           return "fatal";
        case ErrorKind::FatalSystem:         return "system";
        case ErrorKind::RangeNotSatisfiable: return "range not satisfiable";
        case ErrorKind::Cancelled:           return "cancelled";
    }
    return "unknown";
}

ErrorKind classifyHttpStatus(long status) noexcept {
    if (status < 400) {
        return ErrorKind::None;
    }
    if (status == 416) {
        return ErrorKind::RangeNotSatisfiable;
    }
    if (status == 408 || status == 429 || status >= 500) {
        return ErrorKind::Retryable;
    }
    return ErrorKind::FatalFile;
}

} // namespace dsfetch
