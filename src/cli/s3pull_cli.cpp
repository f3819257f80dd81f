#include <s3pull/cli/s3pull_cli.hpp>
#include <s3pull/s3/s3_storage_provider.hpp>
#include <s3pull/version.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <fstream>

namespace s3pull::cli {

namespace {

std::atomic<bool> g_stopRequested{false};

void onStopSignal(int sig) {
    g_stopRequested.store(true);
    // A second signal terminates immediately
    std::signal(sig, SIG_DFL);
}

std::shared_ptr<spdlog::logger> makeLogger() {
    auto logger = spdlog::get("s3pull");
    if (!logger)
        logger = spdlog::stdout_color_mt("s3pull");
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

bool writeReport(const std::string& path, const transfer::RunSummary& summary,
                 const std::shared_ptr<spdlog::logger>& logger) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        logger->error("Cannot write report to {}", path);
        return false;
    }
    out << transfer::toJson(summary).dump(2) << '\n';
    out.flush();
    if (!out) {
        logger->error("Failed while writing report to {}", path);
        return false;
    }
    logger->info("Run report written to {}", path);
    return true;
}

} // namespace

void applyOverrides(const CliOptions& opts, config::AppConfig& cfg) {
    if (opts.targetPath)
        cfg.run.targetDir = config::expand_tilde(*opts.targetPath);
    if (opts.deleteAfterDownload)
        cfg.run.deleteAfterDownload = *opts.deleteAfterDownload;
    if (opts.concurrency)
        cfg.run.concurrency = *opts.concurrency;
    if (opts.logLevel)
        cfg.logLevel = *opts.logLevel;
}

int exitCodeFor(const transfer::RunSummary& summary) noexcept {
    if (summary.cancelled)
        return kExitInterrupted;
    if (!summary.failures.empty() || summary.objectsInterrupted > 0)
        return kExitFailure;
    return kExitOk;
}

int S3PullCLI::run(int argc, char* argv[]) {
    CLI::App app{"s3pull - resumable bulk download of S3 buckets", "s3pull"};
    app.set_version_flag("--version", S3PULL_VERSION_STRING);

    CliOptions opts;
    std::string target;
    std::size_t concurrency = 1;
    std::string logLevel;
    std::string report;
    bool deleteRemote = false;
    bool keepRemote = false;

    auto* configOpt = app.add_option("-c,--config", opts.configPath,
                                     "YAML configuration file (default config.yaml).");
    auto* targetOpt = app.add_option("-t,--target", target, "Local download root.");
    auto* deleteOpt = app.add_flag("--delete-after-download", deleteRemote,
                                   "Delete each remote object once its download is complete.");
    auto* keepOpt = app.add_flag("--keep-remote", keepRemote, "Never delete remote objects.");
    deleteOpt->excludes(keepOpt);
    auto* concurrencyOpt =
        app.add_option("-j,--concurrency", concurrency, "Parallel object transfers per bucket.")
            ->check(CLI::Range(1, 256));
    auto* levelOpt = app.add_option("--log-level", logLevel, "Log level.")
                         ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error",
                                                "critical", "off"}));
    auto* reportOpt = app.add_option("--report", report, "Write a JSON run summary to this file.");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    opts.configGiven = configOpt->count() > 0;
    if (targetOpt->count() > 0)
        opts.targetPath = target;
    if (deleteOpt->count() > 0)
        opts.deleteAfterDownload = true;
    if (keepOpt->count() > 0)
        opts.deleteAfterDownload = false;
    if (concurrencyOpt->count() > 0)
        opts.concurrency = concurrency;
    if (levelOpt->count() > 0)
        opts.logLevel = logLevel;
    if (reportOpt->count() > 0)
        opts.reportPath = report;

    auto logger = makeLogger();
    if (opts.logLevel)
        logger->set_level(spdlog::level::from_str(*opts.logLevel));

    auto loaded = config::loadConfig(opts.configPath, opts.configGiven, logger);
    if (!loaded.ok()) {
        logger->error("{}", loaded.error().message);
        return kExitFailure;
    }
    auto cfg = std::move(loaded).value();
    applyOverrides(opts, cfg);
    if (auto v = config::validate(cfg); !v.ok()) {
        logger->error("{}", v.error().message);
        return kExitFailure;
    }
    logger->set_level(spdlog::level::from_str(cfg.logLevel));

    logger->info("Target download path set to: {}", cfg.run.targetDir.string());
    if (auto prepared = config::prepareTargetDirectory(cfg.run.targetDir); !prepared.ok()) {
        logger->error("{}", prepared.error().message);
        return kExitFailure;
    }
    if (cfg.run.deleteAfterDownload)
        logger->info("Remote objects will be deleted after a complete download.");

    g_stopRequested.store(false);
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    const transfer::ShouldCancel shouldCancel = [] { return g_stopRequested.load(); };

    transfer::RunSummary summary;
    {
        s3::CurlGlobalGuard curl;
        auto provider = s3::S3StorageProvider::create(cfg.s3, logger);
        if (!provider.ok()) {
            logger->error("{}", provider.error().message);
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            return kExitFailure;
        }
        auto& s3 = *provider.value();

        std::shared_ptr<transfer::IRateLimiter> limiter = transfer::makeRateLimiter();
        limiter->setLimits(cfg.transfer.rateLimit);
        auto engine = transfer::makeTransferEngine(s3, cfg.transfer, logger, nullptr, limiter);

        transfer::Orchestrator orchestrator(s3, *engine, cfg.run, logger);
        summary = orchestrator.run(shouldCancel);
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (summary.cancelled)
        logger->warn("Interrupted; partial files are kept and will resume on the next run.");

    int code = exitCodeFor(summary);
    if (opts.reportPath && !writeReport(*opts.reportPath, summary, logger) && code == kExitOk)
        code = kExitFailure;
    return code;
}

} // namespace s3pull::cli
