#pragma once

/*
 * Bulk run over every bucket the provider lists:
 *   list buckets -> ignore rules -> list objects -> transfer (with retry) -> optional delete
 *
 * One object's failure never stops the run. Files of a bucket may be spread over a bounded
 * worker pool; buckets are handled one after another.
 */

#include <s3pull/transfer/bucket_filter.hpp>
#include <s3pull/transfer/deleter.hpp>
#include <s3pull/transfer/transfer.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace s3pull::transfer {

struct OrchestratorConfig {
    std::filesystem::path targetDir{"./s3_download"};
    IgnoreRuleSet ignore{};
    bool deleteAfterDownload{false};
    RetryPolicy retry{};
    std::size_t concurrency{1};
};

/**
 * One object (or bucket, when key is empty) that did not make it.
 */
struct ObjectFailure {
    std::string bucket;
    std::string key;
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
};

struct RunSummary {
    std::size_t bucketsSeen{0};
    std::size_t bucketsSkipped{0};
    std::size_t bucketsFailed{0};
    std::size_t objectsCompleted{0};
    std::size_t objectsFailed{0};
    std::size_t objectsInterrupted{0};
    std::size_t directoriesCreated{0};
    std::uint64_t bytesTransferred{0};
    std::size_t deletionsSucceeded{0};
    std::size_t deletionsFailed{0};
    std::vector<ObjectFailure> failures;
    bool cancelled{false};

    [[nodiscard]] bool ok() const noexcept {
        return !cancelled && failures.empty() && objectsInterrupted == 0;
    }
};

nlohmann::json toJson(const RunSummary& summary);

/**
 * targetDir / bucket / key with the key's '/' structure preserved. Empty (including a leading
 * '/'), "." and ".." segments are rejected with InvalidKey, so distinct file keys never share a
 * path. A single trailing '/' (directory marker) is allowed.
 */
[[nodiscard]] Expected<std::filesystem::path>
destinationPathFor(const std::filesystem::path& targetDir, std::string_view bucket,
                   std::string_view key);

// Waits for the given delay or until shouldCancel() turns true.
using Sleeper = std::function<void(std::chrono::milliseconds, const ShouldCancel&)>;

class Orchestrator {
public:
    /**
     * provider and engine must outlive the orchestrator. disk defaults to makeDiskWriter();
     * sleeper defaults to a cancellable sleep on the calling thread.
     */
    Orchestrator(IStorageProvider& provider, ITransferEngine& engine, OrchestratorConfig cfg,
                 std::shared_ptr<spdlog::logger> logger = nullptr,
                 std::shared_ptr<IDiskWriter> disk = nullptr, Sleeper sleeper = {});

    RunSummary run(const ShouldCancel& shouldCancel = {});

    // Processes a single bucket regardless of the ignore rules.
    void processBucket(const std::string& bucket, RunSummary& summary,
                       const ShouldCancel& shouldCancel);

private:
    struct BucketProgress {
        std::size_t totalFiles{0};
        std::uint64_t totalBytes{0};
        std::uint64_t doneBytes{0};
    };

    void processFile(const RemoteObject& object, std::size_t index, BucketProgress& progress,
                     RunSummary& summary, const ShouldCancel& shouldCancel);
    void processDirectoryMarker(const RemoteObject& marker, RunSummary& summary);
    void recordFailure(RunSummary& summary, const RemoteObject& object, const Error& error);
    void applyDeletion(const RemoteObject& object, RunSummary& summary);

    IStorageProvider& provider_;
    ITransferEngine& engine_;
    OrchestratorConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<IDiskWriter> disk_;
    Sleeper sleeper_;
    PostTransferDeleter deleter_;
    std::mutex mutex_; // guards RunSummary and BucketProgress while workers run
};

} // namespace s3pull::transfer
