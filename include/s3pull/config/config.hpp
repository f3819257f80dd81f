#pragma once

#include <s3pull/core/types.hpp>
#include <s3pull/transfer/orchestrator.hpp>
#include <s3pull/transfer/transfer.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace s3pull::config {

inline constexpr const char* kDefaultConfigFile = "config.yaml";

/**
 * Connection settings for the S3 client. Empty strings leave the SDK default in place.
 */
struct S3Settings {
    std::string region;
    std::string endpoint;
    std::string profile;
    bool usePathStyle{false};
    long connectTimeoutMs{10000};
    long requestTimeoutMs{60000};
};

struct AppConfig {
    transfer::OrchestratorConfig run{};
    transfer::TransferConfig transfer{};
    S3Settings s3{};
    std::string logLevel{"info"};
    std::filesystem::path source{}; // empty when built from defaults
};

// Tilde expansion ("~" and "~/..."); other paths are returned unchanged
std::filesystem::path expand_tilde(const std::string& path);

/**
 * Parse a YAML document into an AppConfig. Unknown keys are ignored; type errors and
 * out-of-range values are ConfigError. An empty document yields the defaults.
 */
Expected<AppConfig> parseConfig(std::string_view yamlText);

/**
 * Load path. When the file does not exist, explicitPath decides: true is a ConfigError,
 * false logs and falls back to defaults.
 */
Expected<AppConfig> loadConfig(const std::filesystem::path& path, bool explicitPath,
                               std::shared_ptr<spdlog::logger> logger = nullptr);

Expected<void> validate(const AppConfig& cfg);

// Recognised spdlog level names
[[nodiscard]] bool isValidLogLevel(std::string_view level) noexcept;

/**
 * Create dir (and parents) and make sure it is a writable directory.
 */
Expected<void> prepareTargetDirectory(const std::filesystem::path& dir);

} // namespace s3pull::config
