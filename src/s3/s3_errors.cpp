#include <s3pull/s3/s3_errors.hpp>

#include <charconv>

namespace s3pull::s3 {

ErrorCode classifyS3Failure(const S3Failure& f) noexcept {
    const auto code = f.s3Code;

    if (f.httpStatus == 404 || code == "NoSuchKey" || code == "NoSuchBucket")
        return ErrorCode::NotFound;
    if (f.httpStatus == 401 || f.httpStatus == 403 || code == "AccessDenied" ||
        code == "InvalidAccessKeyId" || code == "SignatureDoesNotMatch" ||
        code == "ExpiredToken" || code == "InvalidToken")
        return ErrorCode::PermissionDenied;
    // The object shrank or was replaced since it was listed
    if (f.httpStatus == 416 || f.httpStatus == 412 || code == "InvalidRange")
        return ErrorCode::SizeMismatch;
    if (f.httpStatus == 429 || code == "SlowDown" || code == "Throttling" ||
        code == "ThrottlingException" || code == "RequestLimitExceeded")
        return ErrorCode::Throttled;
    if (f.httpStatus == 408 || code == "RequestTimeout")
        return ErrorCode::Timeout;
    if (f.httpStatus >= 500 && f.httpStatus <= 599)
        return ErrorCode::ServerError;
    if (f.transportFailure || f.httpStatus == 0)
        return ErrorCode::NetworkError;
    return ErrorCode::Unknown;
}

std::optional<std::uint64_t> parseContentRangeTotal(std::string_view header) noexcept {
    const auto slash = header.rfind('/');
    if (slash == std::string_view::npos || slash + 1 >= header.size())
        return std::nullopt;
    const auto total = header.substr(slash + 1);
    std::uint64_t value = 0;
    const auto* end = total.data() + total.size();
    auto [ptr, ec] = std::from_chars(total.data(), end, value);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return value;
}

std::string_view unquoteEtag(std::string_view etag) noexcept {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"')
        return etag.substr(1, etag.size() - 2);
    return etag;
}

} // namespace s3pull::s3
