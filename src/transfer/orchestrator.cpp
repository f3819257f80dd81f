#include <s3pull/core/size_format.hpp>
#include <s3pull/transfer/orchestrator.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>

namespace s3pull::transfer {

namespace fs = std::filesystem;

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
    if (attempt < 0)
        attempt = 0;
    const double base = static_cast<double>(initialBackoff.count());
    const double delay = base * std::pow(multiplier, static_cast<double>(attempt));
    const double cap = static_cast<double>(maxBackoff.count());
    if (!std::isfinite(delay) || delay >= cap)
        return maxBackoff;
    return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

namespace {

void cancellableSleep(std::chrono::milliseconds delay, const ShouldCancel& shouldCancel) {
    constexpr auto kSlice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (shouldCancel && shouldCancel())
            return;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds(1), kSlice));
    }
}

bool isUnsafeSegment(std::string_view seg) {
    return seg.empty() || seg == "." || seg == "..";
}

} // namespace

Expected<fs::path> destinationPathFor(const fs::path& targetDir, std::string_view bucket,
                                      std::string_view key) {
    if (isUnsafeSegment(bucket) || bucket.find('/') != std::string_view::npos) {
        return Error{ErrorCode::InvalidKey, "Unusable bucket name '" + std::string(bucket) + "'"};
    }

    // A leading '/' is an empty first segment, so "/a" is rejected rather than aliasing "a"
    std::string_view rest = key;
    const bool marker = !rest.empty() && rest.back() == '/';
    if (marker)
        rest.remove_suffix(1);
    if (rest.empty())
        return Error{ErrorCode::InvalidKey, "Empty object key '" + std::string(key) + "'"};

    fs::path out = targetDir / std::string(bucket);
    while (true) {
        const auto slash = rest.find('/');
        const auto seg = rest.substr(0, slash);
        if (isUnsafeSegment(seg) || seg.find('\0') != std::string_view::npos) {
            return Error{ErrorCode::InvalidKey,
                         "Key '" + std::string(key) + "' has an empty, '.' or '..' segment"};
        }
        out /= std::string(seg);
        if (slash == std::string_view::npos)
            break;
        rest.remove_prefix(slash + 1);
    }
    return out;
}

nlohmann::json toJson(const RunSummary& s) {
    nlohmann::json j;
    j["buckets"] = {{"seen", s.bucketsSeen}, {"skipped", s.bucketsSkipped}, {"failed", s.bucketsFailed}};
    j["objects"] = {{"completed", s.objectsCompleted},
                    {"failed", s.objectsFailed},
                    {"interrupted", s.objectsInterrupted}};
    j["directories_created"] = s.directoriesCreated;
    j["bytes_transferred"] = s.bytesTransferred;
    j["deletions"] = {{"succeeded", s.deletionsSucceeded}, {"failed", s.deletionsFailed}};
    j["cancelled"] = s.cancelled;
    j["failures"] = nlohmann::json::array();
    for (const auto& f : s.failures) {
        j["failures"].push_back({{"bucket", f.bucket},
                                 {"key", f.key},
                                 {"code", errorToString(f.code)},
                                 {"message", f.message}});
    }
    return j;
}

Orchestrator::Orchestrator(IStorageProvider& provider, ITransferEngine& engine,
                           OrchestratorConfig cfg, std::shared_ptr<spdlog::logger> logger,
                           std::shared_ptr<IDiskWriter> disk, Sleeper sleeper)
    : provider_(provider), engine_(engine), config_(std::move(cfg)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()), disk_(std::move(disk)),
      sleeper_(std::move(sleeper)), deleter_(provider, logger_) {
    if (!disk_)
        disk_ = makeDiskWriter(logger_);
    if (!sleeper_)
        sleeper_ = cancellableSleep;
    if (config_.concurrency == 0)
        config_.concurrency = 1;
    if (config_.retry.maxAttempts < 1)
        config_.retry.maxAttempts = 1;
}

RunSummary Orchestrator::run(const ShouldCancel& shouldCancel) {
    RunSummary summary;

    auto buckets = provider_.listBuckets();
    if (!buckets.ok()) {
        logger_->error("Error listing buckets: {}", buckets.error().message);
        summary.failures.push_back(
            ObjectFailure{"", "", buckets.error().code, buckets.error().message});
        return summary;
    }
    if (buckets.value().empty()) {
        logger_->info("No buckets found.");
        return summary;
    }

    for (const auto& bucket : buckets.value()) {
        if (shouldCancel && shouldCancel()) {
            summary.cancelled = true;
            break;
        }
        ++summary.bucketsSeen;

        if (auto reason = exclusionReason(bucket, config_.ignore)) {
            logger_->info("Bucket '{}' ignored because it {}.", bucket, *reason);
            ++summary.bucketsSkipped;
            continue;
        }
        logger_->info("Processing bucket: {}", bucket);
        processBucket(bucket, summary, shouldCancel);
    }

    if (shouldCancel && shouldCancel())
        summary.cancelled = true;

    logger_->info("Run finished: {} completed, {} failed, {} interrupted, {} transferred, "
                  "{} deleted",
                  summary.objectsCompleted, summary.objectsFailed, summary.objectsInterrupted,
                  formatSize(summary.bytesTransferred), summary.deletionsSucceeded);
    return summary;
}

void Orchestrator::processBucket(const std::string& bucket, RunSummary& summary,
                                 const ShouldCancel& shouldCancel) {
    auto listing = provider_.listObjects(bucket);
    if (!listing.ok()) {
        logger_->error("Error listing objects in bucket {}: {}", bucket, listing.error().message);
        std::lock_guard<std::mutex> lk(mutex_);
        ++summary.bucketsFailed;
        summary.failures.push_back(
            ObjectFailure{bucket, "", listing.error().code, listing.error().message});
        return;
    }

    std::vector<RemoteObject> files;
    std::vector<RemoteObject> markers;
    for (auto& obj : listing.value()) {
        if (obj.isDirectoryMarker())
            markers.push_back(std::move(obj));
        else
            files.push_back(std::move(obj));
    }

    BucketProgress progress;
    progress.totalFiles = files.size();
    for (const auto& f : files)
        progress.totalBytes += f.size;
    logger_->info("Bucket '{}' has {} file(s) with a total size of {} bytes.", bucket,
                  progress.totalFiles, progress.totalBytes);

    if (config_.concurrency <= 1 || files.size() <= 1) {
        for (std::size_t i = 0; i < files.size(); ++i) {
            if (shouldCancel && shouldCancel())
                break;
            processFile(files[i], i + 1, progress, summary, shouldCancel);
        }
    } else {
        boost::asio::thread_pool pool(std::min(config_.concurrency, files.size()));
        for (std::size_t i = 0; i < files.size(); ++i) {
            boost::asio::post(pool, [this, &files, i, &progress, &summary, &shouldCancel]() {
                if (shouldCancel && shouldCancel())
                    return;
                try {
                    processFile(files[i], i + 1, progress, summary, shouldCancel);
                } catch (const std::exception& e) {
                    logger_->error("Unexpected error processing {}: {}", files[i].key, e.what());
                    recordFailure(summary, files[i], Error{ErrorCode::Unknown, e.what()});
                }
            });
        }
        pool.join();
    }

    for (const auto& marker : markers) {
        if (shouldCancel && shouldCancel())
            break;
        processDirectoryMarker(marker, summary);
    }
}

void Orchestrator::processFile(const RemoteObject& object, std::size_t index,
                               BucketProgress& progress, RunSummary& summary,
                               const ShouldCancel& shouldCancel) {
    auto dest = destinationPathFor(config_.targetDir, object.bucket, object.key);
    if (!dest.ok()) {
        logger_->error("Skipping key {}: {}", object.key, dest.error().message);
        recordFailure(summary, object, dest.error());
        return;
    }
    const auto& path = dest.value();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        logger_->info("Downloading {} ({}/{} — {}%) {} ---> {}", formatSize(object.size), index,
                      progress.totalFiles, percentOf(progress.doneBytes, progress.totalBytes),
                      object.key, path.string());
    }

    const ProgressCallback onProgress = [this](const ProgressEvent& ev) {
        if (ev.stage == ProgressStage::Downloading) {
            logger_->debug("Progress for {}: {}/{} bytes ({}%)", ev.key, ev.bytesWritten,
                           ev.totalBytes, percentOf(ev.bytesWritten, ev.totalBytes));
        }
    };

    TransferResult result;
    std::uint64_t fresh = 0;
    int attempt = 0;
    for (; attempt < config_.retry.maxAttempts; ++attempt) {
        result = engine_.transfer(object, path, shouldCancel, onProgress);
        fresh += result.newBytes;
        if (result.outcome != TransferOutcome::PartiallyCompletedWillRetry)
            break;
        if (result.error && result.error->code == ErrorCode::Cancelled)
            break;
        if (attempt + 1 >= config_.retry.maxAttempts)
            break;

        const auto delay = config_.retry.backoffFor(attempt);
        logger_->warn("Download incomplete for {}: {}/{} bytes ({}); retrying in {} ms "
                      "(attempt {}/{})",
                      object.key, result.bytesWritten, object.size,
                      result.error ? result.error->message : std::string("short read"),
                      delay.count(), attempt + 2, config_.retry.maxAttempts);
        sleeper_(delay, shouldCancel);
        if (shouldCancel && shouldCancel()) {
            result.error = Error{ErrorCode::Cancelled, "Transfer cancelled"};
            break;
        }
    }

    switch (result.outcome) {
        case TransferOutcome::Completed: {
            {
                std::lock_guard<std::mutex> lk(mutex_);
                ++summary.objectsCompleted;
                summary.bytesTransferred += fresh;
                progress.doneBytes += object.size;
                logger_->info("File {}/{} ({}) downloaded successfully. Total downloaded bytes: "
                              "{}/{}.",
                              index, progress.totalFiles, object.key, progress.doneBytes,
                              progress.totalBytes);
            }
            applyDeletion(object, summary);
            return;
        }
        case TransferOutcome::Failed: {
            const Error err = result.error.value_or(Error{ErrorCode::Unknown, "Transfer failed"});
            logger_->error("Download failed for {}: {} ({}). It will not be deleted from S3.",
                           object.key, err.message, err.code);
            recordFailure(summary, object, err);
            {
                std::lock_guard<std::mutex> lk(mutex_);
                summary.bytesTransferred += fresh;
            }
            return;
        }
        case TransferOutcome::PartiallyCompletedWillRetry:
            break;
    }

    const Error last = result.error.value_or(Error{ErrorCode::NetworkError, "short read"});
    if (last.code == ErrorCode::Cancelled) {
        logger_->warn("Download of {} interrupted at {}/{} bytes; it will resume on the next run.",
                      object.key, result.bytesWritten, object.size);
        std::lock_guard<std::mutex> lk(mutex_);
        ++summary.objectsInterrupted;
        summary.bytesTransferred += fresh;
        return;
    }

    logger_->error("Download incomplete for {}: {}/{} bytes after {} attempts ({}). It will not "
                   "be deleted from S3.",
                   object.key, result.bytesWritten, object.size, config_.retry.maxAttempts,
                   last.message);
    recordFailure(summary, object,
                  Error{last.code, "retries exhausted after " +
                                       std::to_string(config_.retry.maxAttempts) +
                                       " attempts: " + last.message});
    std::lock_guard<std::mutex> lk(mutex_);
    summary.bytesTransferred += fresh;
}

void Orchestrator::processDirectoryMarker(const RemoteObject& marker, RunSummary& summary) {
    auto dest = destinationPathFor(config_.targetDir, marker.bucket, marker.key);
    if (!dest.ok()) {
        logger_->error("Skipping directory key {}: {}", marker.key, dest.error().message);
        recordFailure(summary, marker, dest.error());
        return;
    }

    std::error_code ec;
    const bool existed = fs::is_directory(dest.value(), ec);
    if (!existed) {
        auto made = disk_->ensureDirectory(dest.value());
        if (!made.ok()) {
            logger_->error("Error creating directory for key {}: {}", marker.key,
                           made.error().message);
            recordFailure(summary, marker, made.error());
            return;
        }
        logger_->info("Created directory for key {}", marker.key);
        std::lock_guard<std::mutex> lk(mutex_);
        ++summary.directoriesCreated;
    }
    applyDeletion(marker, summary);
}

void Orchestrator::recordFailure(RunSummary& summary, const RemoteObject& object,
                                 const Error& error) {
    std::lock_guard<std::mutex> lk(mutex_);
    ++summary.objectsFailed;
    summary.failures.push_back(ObjectFailure{object.bucket, object.key, error.code, error.message});
}

void Orchestrator::applyDeletion(const RemoteObject& object, RunSummary& summary) {
    const auto res =
        deleter_.deleteIfConfigured(object, TransferOutcome::Completed, config_.deleteAfterDownload);
    if (res.status == DeletionStatus::Skipped)
        return;
    std::lock_guard<std::mutex> lk(mutex_);
    if (res.status == DeletionStatus::Deleted)
        ++summary.deletionsSucceeded;
    else
        ++summary.deletionsFailed;
}

} // namespace s3pull::transfer
