#include "dsfetch/transfer_outcome.hpp"

#include <utility>

namespace dsfetch {

const char* toString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Completed:   return "completed";
        case OutcomeKind::Skipped:     return "skipped";
        case OutcomeKind::FailedFatal: return "failed";
    }
    return "unknown";
}

TransferOutcome TransferOutcome::completed(std::string filename, std::uint64_t bytes,
                                           std::size_t attempts) {
    return {std::move(filename), OutcomeKind::Completed, {}, bytes, attempts};
}

TransferOutcome TransferOutcome::skipped(std::string filename, std::string reason) {
    return {std::move(filename), OutcomeKind::Skipped, std::move(reason), 0, 0};
}

TransferOutcome TransferOutcome::failed(std::string filename, std::string reason,
                                        std::size_t attempts) {
    return {std::move(filename), OutcomeKind::FailedFatal, std::move(reason), 0, attempts};
}

void RunSummary::record(TransferOutcome outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Completed:   ++completed; break;
        case OutcomeKind::Skipped:     ++skipped; break;
        case OutcomeKind::FailedFatal: ++failed; break;
    }
    outcomes.push_back(std::move(outcome));
}

} // namespace dsfetch
