#pragma once

#include "backoff.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace dsfetch {

inline constexpr const char* kVersion = "1.0.0";

struct TransferConfig {
    std::size_t chunk_size{64 * 1024};
    BackoffPolicy backoff{};
    std::chrono::seconds connect_timeout{30};
    // An attempt moving less than 1 byte/s for this long is aborted and retried.
    std::chrono::seconds stall_timeout{60};
    // 0 = no limit on a single attempt.
    std::chrono::seconds attempt_timeout{0};
    bool verify_existing{true};
    std::string user_agent{std::string("dsfetch/") + kVersion};

    // Metadata lookups are bounded, unlike file transfers.
    std::size_t metadata_attempts{5};
    std::chrono::seconds metadata_timeout{15};
    std::string api_base_url{"https://zenodo.org/api/records/"};

    std::size_t jobs{1};
    bool ignore_case{false};
};

// Throws ConfigError on a malformed file or out-of-range value.
[[nodiscard]] TransferConfig loadConfigFile(const std::filesystem::path& path,
                                            TransferConfig base = {});

// $DSFETCH_CONFIG, ./.dsfetch.yaml, $XDG_CONFIG_HOME/dsfetch/config.yaml, ~/.config/dsfetch/config.yaml.
[[nodiscard]] std::optional<std::filesystem::path> findConfigFile();

} // namespace dsfetch
