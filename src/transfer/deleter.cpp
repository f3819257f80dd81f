#include <s3pull/transfer/deleter.hpp>

#include <spdlog/spdlog.h>

namespace s3pull::transfer {

PostTransferDeleter::PostTransferDeleter(IStorageProvider& provider,
                                         std::shared_ptr<spdlog::logger> logger)
    : provider_(provider), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

DeletionResult PostTransferDeleter::deleteIfConfigured(const RemoteObject& object,
                                                       TransferOutcome outcome, bool enabled) {
    if (!enabled || outcome != TransferOutcome::Completed)
        return DeletionResult{};

    auto r = provider_.deleteObject(object.bucket, object.key);
    if (!r.ok()) {
        logger_->error("Failed to delete s3://{}/{}: {} ({})", object.bucket, object.key,
                       r.error().message, r.error().code);
        return DeletionResult{DeletionStatus::Failed, r.error()};
    }
    logger_->info("Deleted s3://{}/{}", object.bucket, object.key);
    return DeletionResult{DeletionStatus::Deleted, std::nullopt};
}

} // namespace s3pull::transfer
