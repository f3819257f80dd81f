#pragma once

#include <s3pull/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace s3pull::s3 {

/**
 * What a failed S3 call reported, reduced to plain values.
 * httpStatus is 0 when no HTTP response arrived; s3Code is the <Code> of the error body.
 */
struct S3Failure {
    int httpStatus{0};
    std::string_view s3Code;
    bool transportFailure{false};
};

// Maps a failed S3 call onto the shared error taxonomy
ErrorCode classifyS3Failure(const S3Failure& failure) noexcept;

/**
 * Total object length from a Content-Range header ("bytes 0-99/1234" -> 1234).
 * nullopt when absent, malformed or "*".
 */
std::optional<std::uint64_t> parseContentRangeTotal(std::string_view header) noexcept;

// Strips the surrounding double quotes S3 puts around ETags
std::string_view unquoteEtag(std::string_view etag) noexcept;

} // namespace s3pull::s3
