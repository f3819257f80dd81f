#include <s3pull/config/config.hpp>
#include <s3pull/transfer/bucket_filter.hpp>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace s3pull::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn",
                                                     "error", "critical", "off"};

Error configError(std::string msg) {
    return Error{ErrorCode::ConfigError, std::move(msg)};
}

// Accepts a sequence of strings or a single scalar; null leaves the list empty
std::vector<std::string> readStringList(const YAML::Node& node, const char* name) {
    std::vector<std::string> out;
    if (!node || node.IsNull())
        return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence())
        throw YAML::RepresentationException(node.Mark(), std::string(name) + " must be a list");
    for (const auto& item : node)
        out.push_back(item.as<std::string>());
    return out;
}

void readIgnore(const YAML::Node& node, transfer::IgnoreRuleSet& rules) {
    if (!node || node.IsNull())
        return;
    if (!node.IsMap())
        throw YAML::RepresentationException(node.Mark(), "ignore_pattern must be a mapping");
    rules.startsWith = readStringList(node["starts_with"], "ignore_pattern.starts_with");
    rules.endsWith = readStringList(node["ends_with"], "ignore_pattern.ends_with");
    rules.contains = readStringList(node["contains"], "ignore_pattern.contains");
}

void readRetry(const YAML::Node& node, transfer::RetryPolicy& retry) {
    if (!node || node.IsNull())
        return;
    if (!node.IsMap())
        throw YAML::RepresentationException(node.Mark(), "retry must be a mapping");
    if (node["max_attempts"])
        retry.maxAttempts = node["max_attempts"].as<int>();
    if (node["initial_backoff_ms"])
        retry.initialBackoff = std::chrono::milliseconds(node["initial_backoff_ms"].as<long>());
    if (node["multiplier"])
        retry.multiplier = node["multiplier"].as<double>();
    if (node["max_backoff_ms"])
        retry.maxBackoff = std::chrono::milliseconds(node["max_backoff_ms"].as<long>());
}

void readS3(const YAML::Node& node, S3Settings& s3) {
    if (!node || node.IsNull())
        return;
    if (!node.IsMap())
        throw YAML::RepresentationException(node.Mark(), "s3 must be a mapping");
    if (node["region"])
        s3.region = node["region"].as<std::string>();
    if (node["endpoint"])
        s3.endpoint = node["endpoint"].as<std::string>();
    if (node["profile"])
        s3.profile = node["profile"].as<std::string>();
    if (node["use_path_style"])
        s3.usePathStyle = node["use_path_style"].as<bool>();
    if (node["connect_timeout_ms"])
        s3.connectTimeoutMs = node["connect_timeout_ms"].as<long>();
    if (node["request_timeout_ms"])
        s3.requestTimeoutMs = node["request_timeout_ms"].as<long>();
}

} // namespace

fs::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~')
        return path;
    if (path.size() > 1 && path[1] != '/')
        return path; // ~user is not expanded
    const char* home = std::getenv("HOME");
    if (!home || !*home)
        return path;
    if (path.size() <= 2)
        return fs::path(home);
    return fs::path(home) / path.substr(2);
}

bool isValidLogLevel(std::string_view level) noexcept {
    for (auto l : kLogLevels) {
        if (l == level)
            return true;
    }
    return false;
}

Expected<AppConfig> parseConfig(std::string_view yamlText) {
    AppConfig cfg;
    try {
        const YAML::Node root = YAML::Load(std::string(yamlText));
        if (!root || root.IsNull())
            return cfg;
        if (!root.IsMap())
            return configError("Top-level YAML node must be a mapping");

        readIgnore(root["ignore_pattern"], cfg.run.ignore);
        if (root["target_path"])
            cfg.run.targetDir = expand_tilde(root["target_path"].as<std::string>());
        if (root["delete_after_download"])
            cfg.run.deleteAfterDownload = root["delete_after_download"].as<bool>();
        if (root["concurrency"]) {
            const auto n = root["concurrency"].as<long>();
            if (n < 1)
                return configError("concurrency must be at least 1, got " + std::to_string(n));
            cfg.run.concurrency = static_cast<std::size_t>(n);
        }
        readRetry(root["retry"], cfg.run.retry);

        if (root["segment_size_bytes"])
            cfg.transfer.segmentSizeBytes = root["segment_size_bytes"].as<std::size_t>();
        if (root["sync_block_bytes"])
            cfg.transfer.syncBlockBytes = root["sync_block_bytes"].as<std::size_t>();
        if (root["rate_limit_bps"])
            cfg.transfer.rateLimit.bytesPerSecond = root["rate_limit_bps"].as<std::uint64_t>();
        if (root["verify_etag"])
            cfg.transfer.verifyEtag = root["verify_etag"].as<bool>();

        readS3(root["s3"], cfg.s3);
        if (root["log_level"])
            cfg.logLevel = root["log_level"].as<std::string>();
    } catch (const YAML::Exception& e) {
        return configError(std::string("Invalid configuration: ") + e.what());
    }

    auto v = validate(cfg);
    if (!v.ok())
        return v.error();
    return cfg;
}

Expected<void> validate(const AppConfig& cfg) {
    if (cfg.run.targetDir.empty())
        return configError("target_path must not be empty");
    if (cfg.run.concurrency < 1)
        return configError("concurrency must be at least 1");
    if (cfg.run.retry.maxAttempts < 1)
        return configError("retry.max_attempts must be at least 1");
    if (cfg.run.retry.multiplier < 1.0)
        return configError("retry.multiplier must be >= 1.0");
    if (cfg.run.retry.initialBackoff.count() < 0 || cfg.run.retry.maxBackoff.count() < 0)
        return configError("retry backoff values must not be negative");
    if (cfg.transfer.segmentSizeBytes == 0)
        return configError("segment_size_bytes must be greater than 0");
    if (cfg.transfer.syncBlockBytes == 0)
        return configError("sync_block_bytes must be greater than 0");
    if (cfg.s3.connectTimeoutMs <= 0 || cfg.s3.requestTimeoutMs <= 0)
        return configError("s3 timeouts must be greater than 0");
    if (!isValidLogLevel(cfg.logLevel))
        return configError("Unknown log_level '" + cfg.logLevel + "'");
    return Expected<void>{};
}

Expected<AppConfig> loadConfig(const fs::path& path, bool explicitPath,
                               std::shared_ptr<spdlog::logger> logger) {
    if (!logger)
        logger = spdlog::default_logger();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (explicitPath)
            return configError("Config file not found: " + path.string());
        logger->warn("Config file '{}' not found; using defaults", path.string());
        return AppConfig{};
    }

    std::ifstream in(path);
    if (!in) {
        return configError("Error loading config file " + path.string() + ": " +
                           std::strerror(errno));
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    auto parsed = parseConfig(buf.str());
    if (!parsed.ok())
        return Error{ErrorCode::ConfigError, path.string() + ": " + parsed.error().message};

    auto cfg = std::move(parsed).value();
    cfg.source = path;
    for (const auto& rule : transfer::rulesWithEmptyPattern(cfg.run.ignore)) {
        logger->warn("ignore_pattern.{} has an empty entry; it is skipped and ignores no bucket",
                     rule);
    }
    logger->info("Loaded configuration from '{}'", path.string());
    return cfg;
}

Expected<void> prepareTargetDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Cannot create target directory " + dir.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::IoError, "Target path is not a directory: " + dir.string()};
    }
    if (::access(dir.c_str(), W_OK | X_OK) != 0) {
        return Error{ErrorCode::PermissionDenied,
                     "Target directory is not writable: " + dir.string() + ": " +
                         std::strerror(errno)};
    }
    return Expected<void>{};
}

} // namespace s3pull::config
