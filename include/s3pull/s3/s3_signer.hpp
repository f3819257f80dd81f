#pragma once

#include <s3pull/core/types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spdlog {
class logger;
}

namespace s3pull::s3 {

struct Credentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * One request to sign. path is already URI-encoded and starts with '/'; query values are raw
 * and get encoded here. headers are extra headers to sign and send (e.g. Range).
 */
struct RequestTarget {
    std::string method{"GET"};
    std::string host;
    std::string path{"/"};
    HeaderList query;
    HeaderList headers;
};

// RFC 3986 encoding as SigV4 expects; '/' survives when keepSlash is true
std::string uriEncode(std::string_view text, bool keepSlash);

// Sorted, encoded "k=v&k2=v2"
std::string canonicalQueryString(const HeaderList& query);

/**
 * AWS Signature Version 4 for an empty-payload request to service "s3". Returns the headers
 * to send: the caller's extras plus x-amz-date, x-amz-content-sha256, x-amz-security-token
 * (when a session token is present) and Authorization.
 */
HeaderList signRequest(const RequestTarget& target, const Credentials& credentials,
                       const std::string& region,
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/**
 * Credentials for one section of an AWS shared credentials file (INI).
 * nullopt when the section or either key is missing.
 */
std::optional<Credentials> parseSharedCredentials(std::string_view ini, std::string_view profile);

/**
 * Lookup order: a non-empty profile reads that section of the shared credentials file;
 * otherwise AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN, then the
 * AWS_PROFILE (or "default") section. The file is AWS_SHARED_CREDENTIALS_FILE or
 * ~/.aws/credentials. PermissionDenied when nothing usable is found.
 */
Expected<Credentials> resolveCredentials(const std::string& profile,
                                         std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace s3pull::s3
