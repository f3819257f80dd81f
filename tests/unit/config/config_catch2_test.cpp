#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <s3pull/config/config.hpp>

#include "../../support/temp_dir_scope.hpp"
#include "../../support/test_helpers.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;
using namespace s3pull;
using namespace s3pull::config;
using Catch::Matchers::ContainsSubstring;
using s3pull::test_support::TempDirScope;
namespace ts = s3pull::test_support;

TEST_CASE("Config: defaults", "[config]") {
    auto r = parseConfig("");
    REQUIRE(r.ok());
    const auto& cfg = r.value();
    CHECK(cfg.run.targetDir == fs::path("./s3_download"));
    CHECK_FALSE(cfg.run.deleteAfterDownload);
    CHECK(cfg.run.concurrency == 1);
    CHECK(cfg.run.ignore.empty());
    CHECK(cfg.run.retry.maxAttempts == 5);
    CHECK(cfg.transfer.segmentSizeBytes == 8u * 1024 * 1024);
    CHECK(cfg.transfer.syncBlockBytes == 1024u * 1024);
    CHECK(cfg.transfer.rateLimit.bytesPerSecond == 0);
    CHECK(cfg.logLevel == "info");
    CHECK(cfg.source.empty());
}

TEST_CASE("Config: full document", "[config]") {
    auto r = parseConfig(R"(
ignore_pattern:
  starts_with: ["cloudtrail-logs", "cdk-"]
  ends_with: -backup
  contains:
    - tmp
target_path: /srv/s3
delete_after_download: true
concurrency: 6
retry:
  max_attempts: 7
  initial_backoff_ms: 250
  multiplier: 3
  max_backoff_ms: 4000
segment_size_bytes: 1048576
sync_block_bytes: 65536
rate_limit_bps: 5000000
verify_etag: false
s3:
  region: eu-west-1
  endpoint: http://localhost:9000
  profile: backup
  use_path_style: true
  connect_timeout_ms: 2000
  request_timeout_ms: 30000
log_level: debug
unknown_key: ignored
)");
    REQUIRE(r.ok());
    const auto& cfg = r.value();
    CHECK(cfg.run.ignore.startsWith == std::vector<std::string>{"cloudtrail-logs", "cdk-"});
    CHECK(cfg.run.ignore.endsWith == std::vector<std::string>{"-backup"});
    CHECK(cfg.run.ignore.contains == std::vector<std::string>{"tmp"});
    CHECK(cfg.run.targetDir == fs::path("/srv/s3"));
    CHECK(cfg.run.deleteAfterDownload);
    CHECK(cfg.run.concurrency == 6);
    CHECK(cfg.run.retry.maxAttempts == 7);
    CHECK(cfg.run.retry.initialBackoff == std::chrono::milliseconds(250));
    CHECK(cfg.run.retry.multiplier == 3.0);
    CHECK(cfg.run.retry.maxBackoff == std::chrono::milliseconds(4000));
    CHECK(cfg.transfer.segmentSizeBytes == 1048576);
    CHECK(cfg.transfer.syncBlockBytes == 65536);
    CHECK(cfg.transfer.rateLimit.bytesPerSecond == 5000000);
    CHECK_FALSE(cfg.transfer.verifyEtag);
    CHECK(cfg.s3.region == "eu-west-1");
    CHECK(cfg.s3.endpoint == "http://localhost:9000");
    CHECK(cfg.s3.profile == "backup");
    CHECK(cfg.s3.usePathStyle);
    CHECK(cfg.s3.connectTimeoutMs == 2000);
    CHECK(cfg.s3.requestTimeoutMs == 30000);
    CHECK(cfg.logLevel == "debug");
}

TEST_CASE("Config: rejected documents", "[config]") {
    const char* bad[] = {
        "- just\n- a list\n",
        "ignore_pattern: [a, b]\n",
        "ignore_pattern:\n  starts_with: {a: 1}\n",
        "concurrency: 0\n",
        "concurrency: lots\n",
        "delete_after_download: maybe\n",
        "retry:\n  max_attempts: 0\n",
        "retry:\n  multiplier: 0.5\n",
        "segment_size_bytes: 0\n",
        "s3:\n  request_timeout_ms: 0\n",
        "log_level: chatty\n",
        "target_path: \"\"\n",
        "ignore_pattern: {starts_with: [unterminated\n",
    };
    for (const char* doc : bad) {
        INFO(doc);
        auto r = parseConfig(doc);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Config: loading from disk", "[config]") {
    auto tmp = TempDirScope::unique_under("s3pull-config");
    auto logger = ts::nullLogger();

    SECTION("Missing default file falls back to defaults") {
        auto r = loadConfig(tmp / "config.yaml", false, logger);
        REQUIRE(r.ok());
        CHECK(r.value().source.empty());
        CHECK(r.value().run.concurrency == 1);
    }

    SECTION("Missing explicit file is an error") {
        auto r = loadConfig(tmp / "config.yaml", true, logger);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ConfigError);
        CHECK_THAT(r.error().message, ContainsSubstring("not found"));
    }

    SECTION("Existing file is parsed and remembered") {
        const auto file = tmp / "s3pull.yaml";
        ts::writeFile(file, "concurrency: 3\n");
        auto r = loadConfig(file, true, logger);
        REQUIRE(r.ok());
        CHECK(r.value().run.concurrency == 3);
        CHECK(r.value().source == file);
    }

    SECTION("Parse errors name the file") {
        const auto file = tmp / "broken.yaml";
        ts::writeFile(file, "concurrency: -4\n");
        auto r = loadConfig(file, false, logger);
        REQUIRE_FALSE(r.ok());
        CHECK_THAT(r.error().message, ContainsSubstring("broken.yaml"));
    }
}

TEST_CASE("Config: empty ignore patterns are reported", "[config]") {
    auto tmp = TempDirScope::unique_under("s3pull-config");
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    sink->set_pattern("%v");
    sink->set_level(spdlog::level::warn);
    auto logger = std::make_shared<spdlog::logger>("config-warnings", sink);

    const auto file = tmp / "config.yaml";
    ts::writeFile(file, "ignore_pattern:\n  starts_with: [\"\", logs]\n  contains: [x]\n");
    auto r = loadConfig(file, true, logger);
    REQUIRE(r.ok());
    CHECK(r.value().run.ignore.startsWith.size() == 2);

    const auto lines = sink->last_formatted();
    const auto warned = std::count_if(lines.begin(), lines.end(), [](const std::string& l) {
        return l.rfind("ignore_pattern.starts_with", 0) == 0;
    });
    CHECK(warned == 1);
    CHECK(std::none_of(lines.begin(), lines.end(), [](const std::string& l) {
        return l.find("ignore_pattern.contains") != std::string::npos;
    }));
}

TEST_CASE("Config: tilde expansion", "[config]") {
    CHECK(expand_tilde("/abs/path") == fs::path("/abs/path"));
    CHECK(expand_tilde("relative") == fs::path("relative"));
    CHECK(expand_tilde("~other/x") == fs::path("~other/x"));

    const char* home = std::getenv("HOME");
    if (home && *home) {
        CHECK(expand_tilde("~") == fs::path(home));
        CHECK(expand_tilde("~/data") == fs::path(home) / "data");
    }
}

TEST_CASE("Config: log levels", "[config]") {
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"})
        CHECK(isValidLogLevel(level));
    CHECK_FALSE(isValidLogLevel("INFO"));
    CHECK_FALSE(isValidLogLevel(""));
}

TEST_CASE("Config: target directory preparation", "[config]") {
    auto tmp = TempDirScope::unique_under("s3pull-target");

    SECTION("Nested directories are created") {
        const auto dir = tmp / "a" / "b";
        REQUIRE(prepareTargetDirectory(dir).ok());
        CHECK(fs::is_directory(dir));
    }

    SECTION("A file at the target path is rejected") {
        const auto file = tmp / "file";
        ts::writeFile(file, "x");
        CHECK_FALSE(prepareTargetDirectory(file).ok());
    }
}
