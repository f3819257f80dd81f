#pragma once

#include <s3pull/config/config.hpp>
#include <s3pull/s3/s3_signer.hpp>
#include <s3pull/transfer/transfer.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace s3pull::s3 {

/**
 * Scoped curl_global_init / curl_global_cleanup. Must outlive every S3StorageProvider and be
 * created before any other thread starts.
 */
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

/**
 * IStorageProvider speaking the S3 REST API over libcurl with SigV4 signing.
 *
 * Requests go to the configured endpoint, or to s3.<region>.amazonaws.com. Buckets that live in
 * another region are followed once through the x-amz-bucket-region response header and
 * remembered. No transport-level retries; the orchestrator owns retry.
 */
class S3StorageProvider final : public transfer::IStorageProvider {
public:
    // Resolves credentials; PermissionDenied when none are available.
    static Expected<std::unique_ptr<S3StorageProvider>>
    create(const config::S3Settings& settings, std::shared_ptr<spdlog::logger> logger = nullptr);

    S3StorageProvider(config::S3Settings settings, Credentials credentials,
                      std::shared_ptr<spdlog::logger> logger = nullptr);
    ~S3StorageProvider() override;

    Expected<std::vector<std::string>> listBuckets() override;
    Expected<std::vector<transfer::RemoteObject>> listObjects(std::string_view bucket) override;
    Expected<transfer::RangeInfo> getObjectRange(const transfer::RangeRequest& request,
                                                 const transfer::ByteSink& sink,
                                                 const transfer::ShouldCancel& shouldCancel) override;
    Expected<void> deleteObject(std::string_view bucket, std::string_view key) override;

private:
    struct Call;
    struct Response;

    Expected<Response> execute(Call& call);
    Expected<Response> executeForBucket(Call& call);
    std::string regionFor(const std::string& bucket);

    config::S3Settings settings_;
    Credentials credentials_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string scheme_;
    std::string endpointHost_;
    bool customEndpoint_{false};
    std::string defaultRegion_;
    std::mutex regionMutex_;
    std::map<std::string, std::string> bucketRegions_;
};

} // namespace s3pull::s3
