/*
 * s3pull/src/transfer/disk_writer.cpp
 *
 * DiskWriter implementation:
 * - The destination file length is the resume offset; nothing else is persisted
 * - Each append is one write(2) on an O_APPEND descriptor followed by fsync(2)
 * - A failed write or fsync truncates the file back to its pre-append length
 * - New directory entries are made durable by fsyncing the parent directory
 * - A regular file standing where a directory is needed is renamed aside
 */

#include <s3pull/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace s3pull::transfer {

namespace fs = std::filesystem;

namespace {

constexpr const char* kConflictSuffix = "_file_conflict";

std::string errnoMessage(std::string_view what, const fs::path& p, int err) {
    std::string msg(what);
    msg += " failed for ";
    msg += p.string();
    msg += ": ";
    msg += std::strerror(err);
    return msg;
}

// Owns a POSIX descriptor for the duration of one operation
struct FdGuard {
    int fd{-1};
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() {
        if (fd >= 0)
            ::close(fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    explicit operator bool() const noexcept { return fd >= 0; }
};

} // namespace

// ---------- Helpers (platform-specific sync) ----------

static Expected<void> fsync_fd(int fd, const fs::path& p) {
#if defined(__APPLE__)
    // On macOS, F_FULLFSYNC is stricter than fsync
    if (::fcntl(fd, F_FULLFSYNC) == 0)
        return Expected<void>{};
#endif
    if (::fsync(fd) != 0) {
        return Error{ErrorCode::IoError, errnoMessage("fsync()", p, errno)};
    }
    return Expected<void>{};
}

static Expected<void> fsync_dir(const fs::path& dir) {
    FdGuard guard(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!guard) {
        return Error{ErrorCode::IoError, errnoMessage("open(O_DIRECTORY)", dir, errno)};
    }
    return fsync_fd(guard.fd, dir);
}

// ---------- DiskWriter implementation ----------

class DiskWriter final : public IDiskWriter {
public:
    explicit DiskWriter(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

    Expected<std::uint64_t> currentSize(const fs::path& path) override {
        struct stat st {};
        if (::stat(path.c_str(), &st) != 0) {
            if (errno == ENOENT)
                return std::uint64_t{0};
            return Error{ErrorCode::IoError, errnoMessage("stat()", path, errno)};
        }
        if (!S_ISREG(st.st_mode)) {
            return Error{ErrorCode::IoError, "Destination is not a regular file: " + path.string()};
        }
        return static_cast<std::uint64_t>(st.st_size);
    }

    Expected<void> ensureParentDirectory(const fs::path& path) override {
        const auto parent = path.parent_path();
        if (parent.empty())
            return Expected<void>{};
        return ensureDirectory(parent);
    }

    Expected<void> ensureDirectory(const fs::path& dir) override {
        std::error_code ec;
        if (fs::is_directory(dir, ec))
            return Expected<void>{};

        // Walk down from the root so a file blocking any level is moved aside
        fs::path cursor;
        for (const auto& part : dir) {
            cursor /= part;
            if (cursor.empty() || part == cursor.root_path())
                continue;
            ec.clear();
            const auto status = fs::symlink_status(cursor, ec);
            if (ec || !fs::exists(status) || fs::is_directory(fs::status(cursor, ec)))
                continue;

            auto renamed = cursor;
            renamed += kConflictSuffix;
            std::error_code ren_ec;
            fs::rename(cursor, renamed, ren_ec);
            if (ren_ec) {
                return Error{ErrorCode::IoError, "Failed to rename conflicting file " +
                                                     cursor.string() + ": " + ren_ec.message()};
            }
            logger_->info("Renamed conflicting file '{}' to '{}' to create directory.",
                          cursor.string(), renamed.string());
        }

        ec.clear();
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create directory " + dir.string() + ": " + ec.message()};
        }
        logger_->debug("Ensured directory exists: {}", dir.string());
        return Expected<void>{};
    }

    Expected<void> createIfMissing(const fs::path& path) override {
        FdGuard guard(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (!guard) {
            if (errno == EEXIST)
                return Expected<void>{};
            return Error{ErrorCode::IoError, errnoMessage("open(O_CREAT)", path, errno)};
        }
        auto r = fsync_fd(guard.fd, path);
        if (!r.ok())
            return r;
        // Persist the new directory entry
        return fsync_dir(path.has_parent_path() ? path.parent_path() : fs::path("."));
    }

    Expected<void> appendDurable(const fs::path& path, std::span<const std::byte> data) override {
        if (data.empty())
            return Expected<void>{};

        FdGuard guard(::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
        if (!guard) {
            return Error{ErrorCode::IoError, errnoMessage("open(O_APPEND)", path, errno)};
        }

        struct stat st {};
        if (::fstat(guard.fd, &st) != 0) {
            return Error{ErrorCode::IoError, errnoMessage("fstat()", path, errno)};
        }
        const auto before = static_cast<off_t>(st.st_size);

        const auto* p = reinterpret_cast<const char*>(data.data());
        std::size_t remaining = data.size();
        while (remaining > 0) {
            const ssize_t n = ::write(guard.fd, p, remaining);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                const int err = errno;
                rollback(guard.fd, path, before);
                return Error{ErrorCode::IoError, errnoMessage("write()", path, err)};
            }
            p += n;
            remaining -= static_cast<std::size_t>(n);
        }

        auto synced = fsync_fd(guard.fd, path);
        if (!synced.ok()) {
            rollback(guard.fd, path, before);
            return synced;
        }
        return Expected<void>{};
    }

private:
    void rollback(int fd, const fs::path& path, off_t length) noexcept {
        if (::ftruncate(fd, length) != 0 || ::fsync(fd) != 0) {
            logger_->error("Failed to roll back partial append on {}: {}", path.string(),
                           std::strerror(errno));
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<IDiskWriter> makeDiskWriter(std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<DiskWriter>(std::move(logger));
}

} // namespace s3pull::transfer
