#include "dsfetch/config.hpp"

#include "dsfetch/errors.hpp"

#include <cstdint>
#include <cstdlib>
#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace dsfetch {

namespace {

template <typename T>
T readValue(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid value for '{}': {}", key, e.what()));
    }
}

std::int64_t readPositive(const YAML::Node& node, const std::string& key, std::int64_t min_value) {
    const auto value = readValue<std::int64_t>(node, key);
    if (value < min_value) {
        throw ConfigError(fmt::format("'{}' must be >= {}, got {}", key, min_value, value));
    }
    return value;
}

} // namespace

TransferConfig loadConfigFile(const std::filesystem::path& path, TransferConfig base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Cannot load config {}: {}", path.string(), e.what()));
    }
    if (root.IsNull()) {
        return base;
    }
    if (!root.IsMap()) {
        throw ConfigError(fmt::format("Config {} must be a mapping", path.string()));
    }

    static const std::set<std::string> known = {
        "chunk_size", "retry_delay_ms", "retry_backoff_factor", "retry_max_delay_ms",
        "connect_timeout", "stall_timeout", "attempt_timeout", "verify_existing",
        "user_agent", "metadata_attempts", "metadata_timeout", "api_base_url",
        "jobs", "ignore_case",
    };

    for (const auto& entry : root) {
        const auto key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        if (known.count(key) == 0) {
            spdlog::warn("Ignoring unknown config key '{}' in {}", key, path.string());
            continue;
        }

        if (key == "chunk_size") {
            base.chunk_size = static_cast<std::size_t>(readPositive(value, key, 1024));
        } else if (key == "retry_delay_ms") {
            base.backoff.initial_delay = std::chrono::milliseconds(readPositive(value, key, 0));
        } else if (key == "retry_backoff_factor") {
            const auto factor = readValue<double>(value, key);
            if (factor < 1.0) {
                throw ConfigError("'retry_backoff_factor' must be >= 1.0");
            }
            base.backoff.factor = factor;
        } else if (key == "retry_max_delay_ms") {
            base.backoff.max_delay = std::chrono::milliseconds(readPositive(value, key, 0));
        } else if (key == "connect_timeout") {
            base.connect_timeout = std::chrono::seconds(readPositive(value, key, 1));
        } else if (key == "stall_timeout") {
            base.stall_timeout = std::chrono::seconds(readPositive(value, key, 0));
        } else if (key == "attempt_timeout") {
            base.attempt_timeout = std::chrono::seconds(readPositive(value, key, 0));
        } else if (key == "verify_existing") {
            base.verify_existing = readValue<bool>(value, key);
        } else if (key == "user_agent") {
            base.user_agent = readValue<std::string>(value, key);
        } else if (key == "metadata_attempts") {
            base.metadata_attempts = static_cast<std::size_t>(readPositive(value, key, 1));
        } else if (key == "metadata_timeout") {
            base.metadata_timeout = std::chrono::seconds(readPositive(value, key, 1));
        } else if (key == "api_base_url") {
            base.api_base_url = readValue<std::string>(value, key);
        } else if (key == "jobs") {
            base.jobs = static_cast<std::size_t>(readPositive(value, key, 1));
        } else if (key == "ignore_case") {
            base.ignore_case = readValue<bool>(value, key);
        }
    }

    if (base.backoff.max_delay < base.backoff.initial_delay) {
        throw ConfigError("'retry_max_delay_ms' must not be smaller than 'retry_delay_ms'");
    }
    return base;
}

std::optional<std::filesystem::path> findConfigFile() {
    if (const char* env = std::getenv("DSFETCH_CONFIG"); env && *env) {
        return std::filesystem::path{env};
    }

    std::error_code ec;
    std::filesystem::path local{".dsfetch.yaml"};
    if (std::filesystem::exists(local, ec)) {
        return local;
    }

    std::filesystem::path config_home;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        config_home = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        config_home = std::filesystem::path{home} / ".config";
    } else {
        return std::nullopt;
    }

    auto candidate = config_home / "dsfetch" / "config.yaml";
    if (std::filesystem::exists(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

} // namespace dsfetch
