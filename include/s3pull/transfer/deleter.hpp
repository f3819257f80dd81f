#pragma once

#include <s3pull/transfer/transfer.hpp>

#include <memory>
#include <optional>

namespace s3pull::transfer {

enum class DeletionStatus { Skipped, Deleted, Failed };

constexpr const char* deletionStatusToString(DeletionStatus s) {
    switch (s) {
        case DeletionStatus::Skipped: return "skipped";
        case DeletionStatus::Deleted: return "deleted";
        case DeletionStatus::Failed: return "failed";
    }
    return "failed";
}

struct DeletionResult {
    DeletionStatus status{DeletionStatus::Skipped};
    std::optional<Error> error{}; // set when status == Failed
};

/**
 * Removes the remote copy of an object once its local copy is complete. Never touches the
 * local file, and a failed delete is reported rather than retried.
 */
class PostTransferDeleter {
public:
    explicit PostTransferDeleter(IStorageProvider& provider,
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

    // Zero provider calls unless enabled and outcome == Completed.
    DeletionResult deleteIfConfigured(const RemoteObject& object, TransferOutcome outcome,
                                      bool enabled);

private:
    IStorageProvider& provider_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace s3pull::transfer
