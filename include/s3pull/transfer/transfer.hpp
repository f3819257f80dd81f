#pragma once

/*
 * s3pull transfer core - public types and interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces of the resumable transfer
 * subsystem. It contains no implementation details.
 *
 * Design principles:
 * - The destination file is the only resume marker: its length is the number of bytes
 *   retrieved and durably persisted. No sidecar metadata is written.
 * - Every append is followed by fsync before the offset advances.
 * - Retry policy belongs to the caller; the engine reports PartiallyCompletedWillRetry and the
 *   next call resumes from the longer file.
 * - Clear separation of concerns (storage provider, disk writer, integrity verification, rate
 *   limit).
 */

#include <s3pull/core/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
}

namespace s3pull::transfer {

// ================================
// Fundamental enums and constants
// ================================

enum class HashAlgo { Md5, Sha256 };

/**
 * Result classes of one transfer attempt. Only Completed lets the deleter run.
 */
enum class TransferOutcome { Completed, PartiallyCompletedWillRetry, Failed };

enum class ProgressStage { Starting, Downloading, Verifying, Finished };

constexpr const char* outcomeToString(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Completed: return "completed";
        case TransferOutcome::PartiallyCompletedWillRetry: return "partial";
        case TransferOutcome::Failed: return "failed";
    }
    return "failed";
}

inline constexpr std::size_t kDefaultSegmentSizeBytes = 8ull * 1024ull * 1024ull; // 8 MiB
inline constexpr std::size_t kDefaultSyncBlockBytes = 1024ull * 1024ull;          // 1 MiB

// ===================
// Small data objects
// ===================

/**
 * A downloadable unit as listed by the provider. size is authoritative for completion.
 */
struct RemoteObject {
    std::string bucket;
    std::string key;
    std::uint64_t size{0};
    std::optional<std::string> etag{};

    [[nodiscard]] bool isDirectoryMarker() const noexcept {
        return !key.empty() && key.back() == '/';
    }
};

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Md5};
    std::string hex;
};

/**
 * Retry/backoff policy applied by the orchestrator between attempts on one object.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};

    // Delay before retry number `attempt` (0-based): initial * multiplier^attempt, capped.
    [[nodiscard]] std::chrono::milliseconds backoffFor(int attempt) const;
};

/**
 * Aggregate read throughput cap shared by all workers (0 = unlimited).
 */
struct RateLimit {
    std::uint64_t bytesPerSecond{0};
    // Burst allowance in seconds of rate
    double burstSeconds{1.0};
};

/**
 * Engine tuning.
 */
struct TransferConfig {
    std::size_t segmentSizeBytes{kDefaultSegmentSizeBytes};
    std::size_t syncBlockBytes{kDefaultSyncBlockBytes};
    RateLimit rateLimit{};
    bool verifyEtag{false};
};

/**
 * One ranged read: bytes [first, last] inclusive. expectedObjectSize is the size the object
 * had when listed; providers report SizeMismatch when the fetched object disagrees.
 */
struct RangeRequest {
    std::string bucket;
    std::string key;
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> expectedObjectSize{};

    [[nodiscard]] std::uint64_t length() const noexcept { return last - first + 1; }
};

/**
 * What a provider observed while serving a range.
 */
struct RangeInfo {
    std::uint64_t bytesDelivered{0};
    std::optional<std::uint64_t> objectSize{};
};

/**
 * Streaming progress event for a single object.
 */
struct ProgressEvent {
    std::string bucket;
    std::string key;
    std::uint64_t bytesWritten{0};
    std::uint64_t totalBytes{0};
    std::optional<float> percentage{}; // 0.0 - 100.0 (approx)
    ProgressStage stage{ProgressStage::Downloading};
};

/**
 * Result of one transfer() call.
 */
struct TransferResult {
    TransferOutcome outcome{TransferOutcome::Failed};
    std::uint64_t bytesWritten{0}; // file length after the attempt
    std::uint64_t newBytes{0};     // bytes appended by this attempt
    std::optional<Error> error{};  // set for PartiallyCompletedWillRetry and Failed

    [[nodiscard]] bool completed() const noexcept {
        return outcome == TransferOutcome::Completed;
    }
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Remote object store. Credentials and transport are the implementation's business; the
 * core treats it as an opaque capability.
 */
class IStorageProvider {
public:
    virtual ~IStorageProvider() = default;

    virtual Expected<std::vector<std::string>> listBuckets() = 0;

    /**
     * All objects of a bucket, following pagination. Directory markers are included.
     */
    virtual Expected<std::vector<RemoteObject>> listObjects(std::string_view bucket) = 0;

    /**
     * Stream the bytes of request.first..request.last to sink, possibly in several calls on the
     * calling thread. A sink error aborts the read and is returned unchanged.
     */
    virtual Expected<RangeInfo> getObjectRange(const RangeRequest& request, const ByteSink& sink,
                                               const ShouldCancel& shouldCancel) = 0;

    virtual Expected<void> deleteObject(std::string_view bucket, std::string_view key) = 0;
};

/**
 * Local filesystem side of a transfer.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Length of the file at path, 0 if it does not exist.
     */
    virtual Expected<std::uint64_t> currentSize(const std::filesystem::path& path) = 0;

    /**
     * Create every missing parent of path. A regular file occupying a needed directory name
     * is renamed to "<name>_file_conflict".
     */
    virtual Expected<void> ensureParentDirectory(const std::filesystem::path& path) = 0;

    /**
     * Create path as a directory (same conflict handling as ensureParentDirectory).
     */
    virtual Expected<void> ensureDirectory(const std::filesystem::path& dir) = 0;

    /**
     * Create an empty file if none exists and persist the directory entry.
     */
    virtual Expected<void> createIfMissing(const std::filesystem::path& path) = 0;

    /**
     * Append data with a single write in append mode, then fsync. On failure the file is
     * rolled back to its previous length so no torn append remains visible.
     */
    virtual Expected<void> appendDurable(const std::filesystem::path& path,
                                         std::span<const std::byte> data) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks until 'bytes' tokens are available based on configured limits.
     */
    virtual void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) = 0;

    /**
     * Set runtime limits (0 = unlimited).
     */
    virtual void setLimits(const RateLimit& limit) = 0;
};

/**
 * Resumable transfer of one object into one destination file.
 */
class ITransferEngine {
public:
    virtual ~ITransferEngine() = default;

    virtual TransferResult transfer(const RemoteObject& object,
                                    const std::filesystem::path& destination,
                                    const ShouldCancel& shouldCancel = {},
                                    const ProgressCallback& onProgress = {}) = 0;
};

// ======================
// Helpers
// ======================

/**
 * True when etag looks like a single-part MD5 ETag (32 hex characters). Multipart ETags
 * ("<hex>-<parts>") are not content digests.
 */
[[nodiscard]] bool isPlainMd5Etag(std::string_view etag) noexcept;

/**
 * Digest of a whole file. IoError when the file cannot be read.
 */
[[nodiscard]] Expected<Checksum> digestFile(const std::filesystem::path& path, HashAlgo algo);

// ======================
// Factories
// ======================

std::unique_ptr<IDiskWriter> makeDiskWriter(std::shared_ptr<spdlog::logger> logger = nullptr);
std::unique_ptr<IRateLimiter> makeRateLimiter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo = HashAlgo::Md5);

/**
 * The provider must outlive the engine. disk and limiter default to the standard
 * implementations; logger defaults to spdlog's default logger.
 */
std::unique_ptr<ITransferEngine>
makeTransferEngine(IStorageProvider& provider, TransferConfig cfg,
                   std::shared_ptr<spdlog::logger> logger = nullptr,
                   std::shared_ptr<IDiskWriter> disk = nullptr,
                   std::shared_ptr<IRateLimiter> limiter = nullptr);

} // namespace s3pull::transfer
