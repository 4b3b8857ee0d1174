#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dsfetch {

enum class OutcomeKind {
    Completed,
    Skipped,
    FailedFatal,
};

[[nodiscard]] const char* toString(OutcomeKind kind) noexcept;

struct TransferOutcome {
    std::string filename;
    OutcomeKind kind{OutcomeKind::Skipped};
    std::string reason;
    std::uint64_t bytes_written{0};
    std::size_t attempts{0};

    [[nodiscard]] static TransferOutcome completed(std::string filename, std::uint64_t bytes,
                                                   std::size_t attempts);
    [[nodiscard]] static TransferOutcome skipped(std::string filename, std::string reason);
    [[nodiscard]] static TransferOutcome failed(std::string filename, std::string reason,
                                                std::size_t attempts);
};

struct RunSummary {
    // In the order the descriptors were given.
    std::vector<TransferOutcome> outcomes;
    std::size_t completed{0};
    std::size_t skipped{0};
    std::size_t failed{0};
    bool cancelled{false};

    void record(TransferOutcome outcome);
    [[nodiscard]] bool hasFailures() const noexcept { return failed > 0; }
};

} // namespace dsfetch
