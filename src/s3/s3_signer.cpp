#include <s3pull/config/config.hpp>
#include <s3pull/s3/s3_signer.hpp>
#include <s3pull/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <span>
#include <sstream>

namespace s3pull::s3 {

namespace {

constexpr std::string_view kService = "s3";
constexpr std::string_view kEmptyPayloadSha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string_view s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

std::string hexEncode(const unsigned char* data, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(len * 2, '\0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kHex[(data[i] >> 4) & 0xF];
        out[2 * i + 1] = kHex[data[i] & 0xF];
    }
    return out;
}

std::array<unsigned char, 32> hmacSha256(std::string_view key, std::string_view data) {
    std::array<unsigned char, 32> out{};
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data(), &len);
    return out;
}

std::string_view asView(const std::array<unsigned char, 32>& a) {
    return {reinterpret_cast<const char*>(a.data()), a.size()};
}

std::string sha256Hex(std::string_view data) {
    auto hasher = transfer::makeIntegrityVerifier(transfer::HashAlgo::Sha256);
    hasher->update(std::as_bytes(std::span<const char>(data.data(), data.size())));
    return hasher->finalize().hex;
}

// "20130524T000000Z" and "20130524"
std::pair<std::string, std::string> amzDates(std::chrono::system_clock::time_point now) {
    const auto t = std::chrono::system_clock::to_time_t(now);
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    char ts[32];
    char day[16];
    std::strftime(ts, sizeof(ts), "%Y%m%dT%H%M%SZ", &gmt);
    std::strftime(day, sizeof(day), "%Y%m%d", &gmt);
    return {ts, day};
}

std::string envOr(const char* name, std::string fallback = {}) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::move(fallback);
}

} // namespace

std::string uriEncode(std::string_view text, bool keepSlash) {
    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keepSlash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string canonicalQueryString(const HeaderList& query) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query.size());
    for (const auto& [k, v] : query)
        encoded.emplace_back(uriEncode(k, false), uriEncode(v, false));
    std::sort(encoded.begin(), encoded.end());

    std::string out;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (i)
            out.push_back('&');
        out += encoded[i].first;
        out.push_back('=');
        out += encoded[i].second;
    }
    return out;
}

HeaderList signRequest(const RequestTarget& target, const Credentials& credentials,
                       const std::string& region, std::chrono::system_clock::time_point now) {
    const auto [amzDate, day] = amzDates(now);
    const std::string payloadHash(kEmptyPayloadSha256);

    HeaderList signedHeaders;
    signedHeaders.emplace_back("host", toLower(target.host));
    signedHeaders.emplace_back("x-amz-content-sha256", payloadHash);
    signedHeaders.emplace_back("x-amz-date", amzDate);
    if (!credentials.sessionToken.empty())
        signedHeaders.emplace_back("x-amz-security-token", credentials.sessionToken);
    for (const auto& [name, value] : target.headers)
        signedHeaders.emplace_back(toLower(name), trim(value));
    std::sort(signedHeaders.begin(), signedHeaders.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::ostringstream canonicalHeaders;
    std::string signedNames;
    for (std::size_t i = 0; i < signedHeaders.size(); ++i) {
        canonicalHeaders << signedHeaders[i].first << ':' << signedHeaders[i].second << '\n';
        if (i)
            signedNames.push_back(';');
        signedNames += signedHeaders[i].first;
    }

    std::ostringstream cr;
    cr << target.method << '\n'
       << target.path << '\n'
       << canonicalQueryString(target.query) << '\n'
       << canonicalHeaders.str() << '\n'
       << signedNames << '\n'
       << payloadHash;

    const std::string scope =
        day + "/" + region + "/" + std::string(kService) + "/aws4_request";
    std::ostringstream sts;
    sts << "AWS4-HMAC-SHA256\n" << amzDate << '\n' << scope << '\n' << sha256Hex(cr.str());

    const auto kDate = hmacSha256("AWS4" + credentials.secretAccessKey, day);
    const auto kRegion = hmacSha256(asView(kDate), region);
    const auto kSvc = hmacSha256(asView(kRegion), kService);
    const auto kSigning = hmacSha256(asView(kSvc), "aws4_request");
    const auto sig = hmacSha256(asView(kSigning), sts.str());

    HeaderList out = target.headers;
    out.emplace_back("x-amz-date", amzDate);
    out.emplace_back("x-amz-content-sha256", payloadHash);
    if (!credentials.sessionToken.empty())
        out.emplace_back("x-amz-security-token", credentials.sessionToken);
    out.emplace_back("Authorization", "AWS4-HMAC-SHA256 Credential=" + credentials.accessKeyId +
                                          "/" + scope + ", SignedHeaders=" + signedNames +
                                          ", Signature=" + hexEncode(sig.data(), sig.size()));
    return out;
}

std::optional<Credentials> parseSharedCredentials(std::string_view ini, std::string_view profile) {
    Credentials creds;
    bool inSection = false;
    bool seen = false;

    std::istringstream in{std::string(ini)};
    std::string raw;
    while (std::getline(in, raw)) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';')
            continue;
        if (line.front() == '[') {
            const auto close = line.find(']');
            inSection = close != std::string::npos && trim(line.substr(1, close - 1)) == profile;
            seen = seen || inSection;
            continue;
        }
        if (!inSection)
            continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        const auto key = toLower(trim(std::string_view(line).substr(0, eq)));
        auto value = trim(std::string_view(line).substr(eq + 1));
        if (key == "aws_access_key_id")
            creds.accessKeyId = std::move(value);
        else if (key == "aws_secret_access_key")
            creds.secretAccessKey = std::move(value);
        else if (key == "aws_session_token")
            creds.sessionToken = std::move(value);
    }

    if (!seen || creds.accessKeyId.empty() || creds.secretAccessKey.empty())
        return std::nullopt;
    return creds;
}

Expected<Credentials> resolveCredentials(const std::string& profile,
                                         std::shared_ptr<spdlog::logger> logger) {
    if (!logger)
        logger = spdlog::default_logger();

    if (profile.empty()) {
        Credentials env;
        env.accessKeyId = envOr("AWS_ACCESS_KEY_ID");
        env.secretAccessKey = envOr("AWS_SECRET_ACCESS_KEY");
        env.sessionToken = envOr("AWS_SESSION_TOKEN");
        if (!env.accessKeyId.empty() && !env.secretAccessKey.empty()) {
            logger->debug("Using credentials from the environment");
            return env;
        }
    }

    const std::string section = profile.empty() ? envOr("AWS_PROFILE", "default") : profile;
    const auto file = config::expand_tilde(envOr("AWS_SHARED_CREDENTIALS_FILE", "~/.aws/credentials"));

    std::ifstream in(file);
    if (!in) {
        return Error{ErrorCode::PermissionDenied,
                     "No AWS credentials: environment is empty and " + file.string() +
                         " cannot be read"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    auto creds = parseSharedCredentials(buf.str(), section);
    if (!creds) {
        return Error{ErrorCode::PermissionDenied,
                     "No usable credentials for profile '" + section + "' in " + file.string()};
    }
    logger->debug("Using credentials of profile '{}' from {}", section, file.string());
    return *creds;
}

} // namespace s3pull::s3
