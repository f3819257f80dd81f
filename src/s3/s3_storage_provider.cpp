/*
 * s3pull/src/s3/s3_storage_provider.cpp
 *
 * libcurl backed IStorageProvider:
 * - ListBuckets, paginated ListObjectsV2, ranged GetObject, DeleteObject
 * - every request is signed with SigV4 (s3_signer.cpp); failures are classified through
 *   classifyS3Failure() using the HTTP status and the <Code> of the error body
 * - GetObject bodies stream straight into the sink from the write callback; a cancel request
 *   aborts the transfer from the write or progress callback
 */

#include <s3pull/s3/s3_errors.hpp>
#include <s3pull/s3/s3_storage_provider.hpp>
#include <s3pull/s3/s3_xml.hpp>

#include <spdlog/spdlog.h>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace s3pull::s3 {

namespace {

constexpr std::size_t kMaxBufferedBody = 1 << 20;
constexpr const char* kDefaultRegion = "us-east-1";

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

std::string objectUri(std::string_view bucket, std::string_view key) {
    return fmt::format("s3://{}/{}", bucket, key);
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_SSL_CONNECT_ERROR:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

struct CurlHandle {
    CURL* curl{curl_easy_init()};
    ~CurlHandle() {
        if (curl)
            curl_easy_cleanup(curl);
    }
    CurlHandle() = default;
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderListGuard {
    curl_slist* list{nullptr};
    ~HeaderListGuard() {
        if (list)
            curl_slist_free_all(list);
    }
};

} // namespace

// One request as the provider sees it, before signing
struct S3StorageProvider::Call {
    std::string method{"GET"};
    std::string bucket; // empty for service-level calls
    std::string encodedKey;
    HeaderList query;
    HeaderList headers;
    std::string what; // for messages

    // Set for GetObject; the body then streams into sink instead of being buffered
    const transfer::RangeRequest* range{nullptr};
    const transfer::ByteSink* sink{nullptr};
    const transfer::ShouldCancel* shouldCancel{nullptr};
};

struct S3StorageProvider::Response {
    long status{0};
    std::string body;
    std::uint64_t delivered{0};
    std::optional<std::uint64_t> objectSize;
    std::string bucketRegion;
};

namespace {

struct TransferState {
    CURL* curl{nullptr};
    const transfer::RangeRequest* range{nullptr};
    const transfer::ByteSink* sink{nullptr};
    const transfer::ShouldCancel* shouldCancel{nullptr};

    long status{0};
    bool streaming{false};
    bool cancelled{false};
    std::optional<Error> abortError;
    std::string body;
    std::string contentRange;
    std::string bucketRegion;
    std::uint64_t delivered{0};

    bool cancelRequested() const { return shouldCancel && *shouldCancel && (*shouldCancel)(); }
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* st = static_cast<TransferState*>(userdata);
    std::string_view line(buffer, total);

    // A new status line (e.g. after 100 Continue) starts a fresh header block
    if (line.rfind("HTTP/", 0) == 0) {
        st->contentRange.clear();
        st->bucketRegion.clear();
        return total;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;
    const auto key = toLower(trim(line.substr(0, colon)));
    if (key == "content-range")
        st->contentRange = trim(line.substr(colon + 1));
    else if (key == "x-amz-bucket-region")
        st->bucketRegion = trim(line.substr(colon + 1));
    return total;
}

// Decides on the first body chunk whether the body is data for the sink or an error document
std::optional<Error> beginBody(TransferState& st) {
    curl_easy_getinfo(st.curl, CURLINFO_RESPONSE_CODE, &st.status);
    if (!st.sink || st.status >= 300)
        return std::nullopt;

    if (st.status != 206) {
        return Error{ErrorCode::Unknown,
                     fmt::format("Endpoint answered a ranged GET with HTTP {}", st.status)};
    }
    const auto total = parseContentRangeTotal(st.contentRange);
    if (st.range && st.range->expectedObjectSize && total &&
        *total != *st.range->expectedObjectSize) {
        return Error{ErrorCode::SizeMismatch,
                     fmt::format("s3://{}/{} is now {} bytes, listed as {}", st.range->bucket,
                                 st.range->key, *total, *st.range->expectedObjectSize)};
    }
    st.streaming = true;
    return std::nullopt;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* st = static_cast<TransferState*>(userdata);
    if (total == 0)
        return 0;

    if (st->cancelRequested()) {
        st->cancelled = true;
        return 0; // CURLE_WRITE_ERROR
    }

    if (st->status == 0) {
        if (auto err = beginBody(*st)) {
            st->abortError = std::move(err);
            return 0;
        }
    }

    if (!st->streaming) {
        if (st->body.size() + total > kMaxBufferedBody) {
            st->abortError = Error{ErrorCode::Unknown, "Response body too large"};
            return 0;
        }
        st->body.append(ptr, total);
        return total;
    }

    auto r = (*st->sink)(std::as_bytes(std::span<const char>(ptr, total)));
    if (!r.ok()) {
        st->abortError = r.error();
        return 0;
    }
    st->delivered += total;
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* st = static_cast<TransferState*>(userdata);
    if (st->cancelRequested()) {
        st->cancelled = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

} // namespace

CurlGlobalGuard::CurlGlobalGuard() {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
        throw std::runtime_error("curl_global_init failed");
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

Expected<std::unique_ptr<S3StorageProvider>>
S3StorageProvider::create(const config::S3Settings& settings,
                          std::shared_ptr<spdlog::logger> logger) {
    auto creds = resolveCredentials(settings.profile, logger);
    if (!creds.ok())
        return creds.error();
    return std::make_unique<S3StorageProvider>(settings, std::move(creds).value(),
                                               std::move(logger));
}

S3StorageProvider::S3StorageProvider(config::S3Settings settings, Credentials credentials,
                                     std::shared_ptr<spdlog::logger> logger)
    : settings_(std::move(settings)), credentials_(std::move(credentials)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
    defaultRegion_ = settings_.region;
    if (defaultRegion_.empty()) {
        for (const char* name : {"AWS_REGION", "AWS_DEFAULT_REGION"}) {
            const char* v = std::getenv(name);
            if (v && *v) {
                defaultRegion_ = v;
                break;
            }
        }
    }
    if (defaultRegion_.empty())
        defaultRegion_ = kDefaultRegion;

    scheme_ = "https";
    if (!settings_.endpoint.empty()) {
        customEndpoint_ = true;
        std::string_view ep = settings_.endpoint;
        if (auto pos = ep.find("://"); pos != std::string_view::npos) {
            scheme_ = toLower(ep.substr(0, pos));
            ep.remove_prefix(pos + 3);
        }
        endpointHost_ = std::string(ep.substr(0, ep.find('/')));
    }

    logger_->debug("S3 provider ready (region='{}', endpoint='{}', profile='{}', path_style={})",
                   defaultRegion_, settings_.endpoint, settings_.profile, settings_.usePathStyle);
}

S3StorageProvider::~S3StorageProvider() = default;

std::string S3StorageProvider::regionFor(const std::string& bucket) {
    std::lock_guard<std::mutex> lk(regionMutex_);
    auto it = bucketRegions_.find(bucket);
    return it != bucketRegions_.end() ? it->second : defaultRegion_;
}

Expected<S3StorageProvider::Response> S3StorageProvider::execute(Call& call) {
    const std::string region = call.bucket.empty() ? defaultRegion_ : regionFor(call.bucket);
    const std::string host =
        customEndpoint_ ? endpointHost_ : "s3." + region + ".amazonaws.com";

    // Dotted bucket names break TLS host matching under virtual-hosted addressing
    const bool pathStyle = settings_.usePathStyle || call.bucket.find('.') != std::string::npos;

    RequestTarget target;
    target.method = call.method;
    target.query = call.query;
    target.headers = call.headers;
    if (call.bucket.empty()) {
        target.host = host;
        target.path = "/";
    } else if (pathStyle) {
        target.host = host;
        target.path = "/" + uriEncode(call.bucket, false) + "/" + call.encodedKey;
    } else {
        target.host = call.bucket + "." + host;
        target.path = "/" + call.encodedKey;
    }

    std::string url = scheme_ + "://" + target.host + target.path;
    if (const auto q = canonicalQueryString(target.query); !q.empty())
        url += "?" + q;

    CurlHandle handle;
    if (!handle.curl)
        return Error{ErrorCode::Unknown, "curl_easy_init failed"};
    CURL* curl = handle.curl;

    HeaderListGuard headers;
    for (const auto& [name, value] : signRequest(target, credentials_, region)) {
        const std::string line = name + ": " + value;
        headers.list = curl_slist_append(headers.list, line.c_str());
    }

    TransferState st;
    st.curl = curl;
    st.range = call.range;
    st.sink = call.sink;
    st.shouldCancel = call.shouldCancel;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_PATH_AS_IS, 1L);
    if (call.method == "GET")
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    else
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, call.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &st);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, settings_.connectTimeoutMs);
    // request_timeout_ms bounds a stall, not a whole (possibly large) ranged body
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     std::max(1L, settings_.requestTimeoutMs / 1000));
    if (!call.sink)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, settings_.requestTimeoutMs);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

    const CURLcode rc = curl_easy_perform(curl);

    if (st.cancelled || rc == CURLE_ABORTED_BY_CALLBACK)
        return Error{ErrorCode::Cancelled, call.what + " cancelled"};
    if (st.abortError)
        return *st.abortError;
    if (rc != CURLE_OK)
        return makeCurlError(rc, call.what);

    Response resp;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(st.body);
    resp.delivered = st.delivered;
    resp.objectSize = parseContentRangeTotal(st.contentRange);
    resp.bucketRegion = std::move(st.bucketRegion);

    if (resp.status >= 300) {
        const auto code = firstTag(resp.body, "Code").value_or("");
        const auto message = firstTag(resp.body, "Message").value_or("");
        S3Failure failure{static_cast<int>(resp.status), code, false};
        Error err{classifyS3Failure(failure),
                  fmt::format("{}: {} (HTTP {}) {}", call.what, code.empty() ? "error" : code,
                              resp.status, message)};
        // Keep the region hint for executeForBucket
        if (!resp.bucketRegion.empty() && resp.bucketRegion != region &&
            (resp.status == 301 || resp.status == 400))
            return resp;
        return err;
    }
    return resp;
}

Expected<S3StorageProvider::Response> S3StorageProvider::executeForBucket(Call& call) {
    auto resp = execute(call);
    if (!resp.ok() || resp.value().status < 300)
        return resp;

    // Redirected to the bucket's home region: remember it and try once more
    const auto& hinted = resp.value().bucketRegion;
    if (customEndpoint_) {
        return Error{ErrorCode::Unknown,
                     fmt::format("{}: bucket lives in region {} (HTTP {})", call.what, hinted,
                                 resp.value().status)};
    }
    logger_->debug("Bucket {} is in region {}; retrying there", call.bucket, hinted);
    {
        std::lock_guard<std::mutex> lk(regionMutex_);
        bucketRegions_[call.bucket] = hinted;
    }
    auto again = execute(call);
    if (again.ok() && again.value().status >= 300) {
        return Error{ErrorCode::Unknown,
                     fmt::format("{}: redirected again after switching to region {}", call.what,
                                 hinted)};
    }
    return again;
}

Expected<std::vector<std::string>> S3StorageProvider::listBuckets() {
    Call call;
    call.what = "ListBuckets";
    auto resp = execute(call);
    if (!resp.ok())
        return resp.error();
    if (resp.value().status >= 300)
        return Error{ErrorCode::Unknown, "ListBuckets: unexpected redirect"};

    auto names = parseBucketNames(resp.value().body);
    logger_->debug("ListBuckets returned {} bucket(s)", names.size());
    return names;
}

Expected<std::vector<transfer::RemoteObject>>
S3StorageProvider::listObjects(std::string_view bucket) {
    std::vector<transfer::RemoteObject> objects;
    std::string token;
    while (true) {
        Call call;
        call.bucket = std::string(bucket);
        call.what = "ListObjectsV2 " + call.bucket;
        call.query.emplace_back("list-type", "2");
        if (!token.empty())
            call.query.emplace_back("continuation-token", token);

        auto resp = executeForBucket(call);
        if (!resp.ok())
            return resp.error();
        auto page = parseListObjectsPage(resp.value().body, bucket);
        if (!page.ok())
            return page.error();

        auto& p = page.value();
        objects.insert(objects.end(), std::make_move_iterator(p.objects.begin()),
                       std::make_move_iterator(p.objects.end()));
        if (!p.truncated || p.nextContinuationToken.empty())
            break;
        token = std::move(p.nextContinuationToken);
    }
    return objects;
}

Expected<transfer::RangeInfo>
S3StorageProvider::getObjectRange(const transfer::RangeRequest& request,
                                  const transfer::ByteSink& sink,
                                  const transfer::ShouldCancel& shouldCancel) {
    if (shouldCancel && shouldCancel())
        return Error{ErrorCode::Cancelled, "GetObject " + objectUri(request.bucket, request.key) +
                                               " cancelled"};

    Call call;
    call.bucket = request.bucket;
    call.encodedKey = uriEncode(request.key, true);
    call.headers.emplace_back("Range", fmt::format("bytes={}-{}", request.first, request.last));
    call.what = fmt::format("GetObject {} bytes={}-{}", objectUri(request.bucket, request.key),
                            request.first, request.last);
    call.range = &request;
    call.sink = &sink;
    call.shouldCancel = &shouldCancel;

    auto resp = executeForBucket(call);
    if (!resp.ok())
        return resp.error();

    transfer::RangeInfo info;
    info.bytesDelivered = resp.value().delivered;
    info.objectSize = resp.value().objectSize;
    return info;
}

Expected<void> S3StorageProvider::deleteObject(std::string_view bucket, std::string_view key) {
    Call call;
    call.method = "DELETE";
    call.bucket = std::string(bucket);
    call.encodedKey = uriEncode(key, true);
    call.what = "DeleteObject " + objectUri(bucket, key);

    auto resp = executeForBucket(call);
    if (!resp.ok())
        return resp.error();
    return Expected<void>{};
}

} // namespace s3pull::s3
