#pragma once

#include <s3pull/config/config.hpp>
#include <s3pull/transfer/orchestrator.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace s3pull::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitInterrupted = 130;

/**
 * Values given on the command line. Unset optionals keep the configuration file's value.
 */
struct CliOptions {
    std::string configPath{config::kDefaultConfigFile};
    bool configGiven{false};
    std::optional<std::string> targetPath;
    std::optional<bool> deleteAfterDownload;
    std::optional<std::size_t> concurrency;
    std::optional<std::string> logLevel;
    std::optional<std::string> reportPath;
};

void applyOverrides(const CliOptions& opts, config::AppConfig& cfg);

// 130 when cancelled, 1 when anything failed, 0 otherwise.
int exitCodeFor(const transfer::RunSummary& summary) noexcept;

class S3PullCLI {
public:
    S3PullCLI() = default;

    // Parses argv, runs the download, and returns the process exit code.
    int run(int argc, char* argv[]);
};

} // namespace s3pull::cli
