/*
 * s3pull/src/transfer/integrity_verifier.cpp
 *
 * Streaming MD5 / SHA-256 via OpenSSL EVP, plus the whole-file digest used to compare a
 * finished download against a single-part S3 ETag.
 */

#include <s3pull/transfer/transfer.hpp>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace s3pull::transfer {

namespace {

// RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
    }
    return EVP_md5();
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kHex[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    void reset(HashAlgo algo) override {
        algo_ = algo;
        ready_ = ctx_ && EVP_DigestInit_ex(ctx_.ctx, resolve_algo(algo_), nullptr) == 1;
    }

    void update(std::span<const std::byte> data) override {
        if (!ready_ || data.empty())
            return;
        if (EVP_DigestUpdate(ctx_.ctx, data.data(), data.size()) != 1)
            ready_ = false;
    }

    // Empty hex signals a digest failure; callers treat it as a mismatch.
    Checksum finalize() override {
        Checksum out{algo_, {}};
        if (!ready_)
            return out;

        std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(ctx_.ctx, md.data(), &md_len) == 1)
            out.hex = to_hex_lower(md.data(), md_len);

        reset(algo_);
        return out;
    }

private:
    HashAlgo algo_{HashAlgo::Md5};
    EvpMdCtx ctx_{};
    bool ready_{false};
};

} // namespace

bool isPlainMd5Etag(std::string_view etag) noexcept {
    if (etag.size() != 32)
        return false;
    for (char c : etag) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

Expected<Checksum> digestFile(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError,
                     "Cannot open " + path.string() + " for hashing: " + std::strerror(errno)};
    }

    OpenSslIntegrityVerifier verifier(algo);
    std::vector<char> buf(1 << 16);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got > 0) {
            verifier.update(std::as_bytes(std::span<const char>(buf.data(), static_cast<std::size_t>(got))));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read error while hashing " + path.string()};
    }

    auto sum = verifier.finalize();
    if (sum.hex.empty()) {
        return Error{ErrorCode::Unknown, "Digest computation failed for " + path.string()};
    }
    return sum;
}

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

} // namespace s3pull::transfer
