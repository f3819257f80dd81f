/*
 * s3pull/src/transfer/transfer_engine.cpp
 *
 * Resumable single-object transfer:
 * - Resume offset = current destination length (IDiskWriter::currentSize)
 * - Ranged reads of at most segmentSizeBytes, each carrying the listed object size so the
 *   provider can refuse an object that changed since listing
 * - Received bytes are staged up to syncBlockBytes, then appended durably; the staged prefix
 *   is also flushed when a stream ends, fails or is cancelled
 * - Transient provider errors and short streams yield PartiallyCompletedWillRetry; the caller
 *   decides whether and when to call again
 * - Completed only when the destination length on disk equals the object size
 * - Optional MD5 check of the finished file against a single-part ETag
 */

#include <s3pull/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace s3pull::transfer {

namespace {

std::string lowerHex(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

TransferResult makeResult(TransferOutcome outcome, std::uint64_t written, std::uint64_t fresh,
                          std::optional<Error> error = std::nullopt) {
    TransferResult r;
    r.outcome = outcome;
    r.bytesWritten = written;
    r.newBytes = fresh;
    r.error = std::move(error);
    return r;
}

} // namespace

class TransferEngine final : public ITransferEngine {
public:
    TransferEngine(IStorageProvider& provider, TransferConfig cfg,
                   std::shared_ptr<spdlog::logger> logger, std::shared_ptr<IDiskWriter> disk,
                   std::shared_ptr<IRateLimiter> limiter)
        : provider_(provider), config_(cfg),
          logger_(logger ? std::move(logger) : spdlog::default_logger()), disk_(std::move(disk)),
          limiter_(std::move(limiter)) {
        if (config_.segmentSizeBytes == 0)
            config_.segmentSizeBytes = kDefaultSegmentSizeBytes;
        if (config_.syncBlockBytes == 0)
            config_.syncBlockBytes = kDefaultSyncBlockBytes;
        if (!disk_)
            disk_ = makeDiskWriter(logger_);
        if (!limiter_) {
            limiter_ = makeRateLimiter();
            limiter_->setLimits(config_.rateLimit);
        }
    }

    TransferResult transfer(const RemoteObject& object, const std::filesystem::path& destination,
                            const ShouldCancel& shouldCancel,
                            const ProgressCallback& onProgress) override {
        const auto emit = [&](std::uint64_t written, ProgressStage stage) {
            if (!onProgress)
                return;
            ProgressEvent ev;
            ev.bucket = object.bucket;
            ev.key = object.key;
            ev.bytesWritten = written;
            ev.totalBytes = object.size;
            if (object.size > 0) {
                ev.percentage = static_cast<float>(static_cast<double>(written) * 100.0 /
                                                   static_cast<double>(object.size));
            } else {
                ev.percentage = 100.0f;
            }
            ev.stage = stage;
            onProgress(ev);
        };

        auto sizeRes = disk_->currentSize(destination);
        if (!sizeRes.ok())
            return makeResult(TransferOutcome::Failed, 0, 0, sizeRes.error());
        std::uint64_t written = sizeRes.value();

        if (written > object.size) {
            logger_->warn("Local file {} has {} bytes but s3://{}/{} has only {}; leaving it as is",
                          destination.string(), written, object.bucket, object.key, object.size);
            return makeResult(TransferOutcome::Failed, written, 0,
                              Error{ErrorCode::SizeExceedsExpected,
                                    "Local file is " + std::to_string(written) +
                                        " bytes, remote object is " +
                                        std::to_string(object.size)});
        }

        emit(written, ProgressStage::Starting);

        if (written == object.size) {
            if (object.size == 0) {
                auto dir = disk_->ensureParentDirectory(destination);
                if (!dir.ok())
                    return makeResult(TransferOutcome::Failed, 0, 0, dir.error());
                auto created = disk_->createIfMissing(destination);
                if (!created.ok())
                    return makeResult(TransferOutcome::Failed, 0, 0, created.error());
            } else {
                logger_->debug("{} already complete ({} bytes)", destination.string(), written);
            }
            return finish(object, destination, written, 0, emit);
        }

        auto dir = disk_->ensureParentDirectory(destination);
        if (!dir.ok())
            return makeResult(TransferOutcome::Failed, written, 0, dir.error());

        if (written > 0) {
            logger_->debug("Resuming s3://{}/{} at offset {} of {}", object.bucket, object.key,
                           written, object.size);
        }

        const std::uint64_t startedAt = written;
        std::vector<std::byte> staged;
        staged.reserve(std::min<std::uint64_t>(config_.syncBlockBytes, object.size - written));
        std::optional<Error> diskError;

        const auto flush = [&]() -> Expected<void> {
            if (staged.empty())
                return Expected<void>{};
            auto r = disk_->appendDurable(destination, staged);
            if (!r.ok()) {
                staged.clear();
                diskError = r.error();
                return r;
            }
            written += staged.size();
            staged.clear();
            emit(written, ProgressStage::Downloading);
            return Expected<void>{};
        };

        const auto cancelled = [&] { return shouldCancel && shouldCancel(); };
        const auto interrupted = [&](Error err) {
            return makeResult(TransferOutcome::PartiallyCompletedWillRetry, written,
                              written - startedAt, std::move(err));
        };

        while (written < object.size) {
            if (cancelled())
                return interrupted(Error{ErrorCode::Cancelled, "Transfer cancelled"});

            RangeRequest req;
            req.bucket = object.bucket;
            req.key = object.key;
            req.first = written;
            req.last = std::min<std::uint64_t>(written + config_.segmentSizeBytes - 1,
                                               object.size - 1);
            req.expectedObjectSize = object.size;

            const std::uint64_t requested = req.length();
            std::uint64_t received = 0;

            ByteSink sink = [&](std::span<const std::byte> data) -> Expected<void> {
                if (received + data.size() > requested) {
                    return Error{ErrorCode::SizeMismatch,
                                 "Provider delivered more than the " + std::to_string(requested) +
                                     " bytes requested"};
                }
                limiter_->acquire(data.size(), shouldCancel);
                staged.insert(staged.end(), data.begin(), data.end());
                received += data.size();
                if (staged.size() >= config_.syncBlockBytes)
                    return flush();
                return Expected<void>{};
            };

            auto got = provider_.getObjectRange(req, sink, shouldCancel);

            // Whatever was staged is a valid prefix
            auto flushed = flush();
            if (diskError) {
                return makeResult(TransferOutcome::Failed, written, written - startedAt,
                                  *diskError);
            }
            if (!flushed.ok())
                return makeResult(TransferOutcome::Failed, written, written - startedAt,
                                  flushed.error());

            if (!got.ok()) {
                const auto& err = got.error();
                if (err.code == ErrorCode::Cancelled || cancelled())
                    return interrupted(Error{ErrorCode::Cancelled, "Transfer cancelled"});
                if (isTransient(err.code)) {
                    logger_->debug("Transient error on s3://{}/{} at offset {}: {} ({})",
                                   object.bucket, object.key, written, err.message, err.code);
                    return interrupted(err);
                }
                return makeResult(TransferOutcome::Failed, written, written - startedAt, err);
            }

            if (received < requested) {
                if (cancelled())
                    return interrupted(Error{ErrorCode::Cancelled, "Transfer cancelled"});
                return interrupted(Error{ErrorCode::NetworkError,
                                         "Stream ended after " + std::to_string(received) +
                                             " of " + std::to_string(requested) + " bytes"});
            }
        }

        return finish(object, destination, written, written - startedAt, emit);
    }

private:
    template <typename Emit>
    TransferResult finish(const RemoteObject& object, const std::filesystem::path& destination,
                          std::uint64_t written, std::uint64_t fresh, const Emit& emit) {
        // The file on disk, not the in-memory counter, decides completion
        auto onDisk = disk_->currentSize(destination);
        if (!onDisk.ok())
            return makeResult(TransferOutcome::Failed, written, fresh, onDisk.error());
        if (onDisk.value() != object.size) {
            logger_->error("{} holds {} bytes after transferring s3://{}/{} ({} bytes)",
                           destination.string(), onDisk.value(), object.bucket, object.key,
                           object.size);
            return makeResult(TransferOutcome::Failed, onDisk.value(), fresh,
                              Error{ErrorCode::SizeMismatch,
                                    "Local file is " + std::to_string(onDisk.value()) +
                                        " bytes after transfer, expected " +
                                        std::to_string(object.size)});
        }

        if (config_.verifyEtag && object.etag && isPlainMd5Etag(*object.etag)) {
            emit(written, ProgressStage::Verifying);
            auto digest = digestFile(destination, HashAlgo::Md5);
            if (!digest.ok())
                return makeResult(TransferOutcome::Failed, written, fresh, digest.error());
            const auto expected = lowerHex(*object.etag);
            if (digest.value().hex != expected) {
                logger_->error("MD5 of {} is {}, ETag is {}", destination.string(),
                               digest.value().hex, expected);
                return makeResult(TransferOutcome::Failed, written, fresh,
                                  Error{ErrorCode::ChecksumMismatch,
                                        "MD5 " + digest.value().hex + " does not match ETag " +
                                            expected});
            }
        }
        emit(written, ProgressStage::Finished);
        return makeResult(TransferOutcome::Completed, written, fresh);
    }

    IStorageProvider& provider_;
    TransferConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<IDiskWriter> disk_;
    std::shared_ptr<IRateLimiter> limiter_;
};

std::unique_ptr<ITransferEngine> makeTransferEngine(IStorageProvider& provider, TransferConfig cfg,
                                                    std::shared_ptr<spdlog::logger> logger,
                                                    std::shared_ptr<IDiskWriter> disk,
                                                    std::shared_ptr<IRateLimiter> limiter) {
    return std::make_unique<TransferEngine>(provider, cfg, std::move(logger), std::move(disk),
                                            std::move(limiter));
}

} // namespace s3pull::transfer
