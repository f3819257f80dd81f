#pragma once

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace s3pull::test_support {

// A fresh directory under the system temp dir (mkdtemp), removed with its contents on
// destruction. Stands in for a download root in tests.
class TempDirScope {
public:
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;
    TempDirScope(TempDirScope&& other) noexcept : root_(std::move(other.root_)) {
        other.root_.clear();
    }

    ~TempDirScope() {
        if (root_.empty())
            return;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& path() const { return root_; }

    std::filesystem::path operator/(const std::filesystem::path& rel) const { return root_ / rel; }

    // Throws std::system_error when the directory cannot be created
    static TempDirScope unique_under(const std::string& prefix) {
        const auto tmpl = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr)
            throw std::system_error(errno, std::generic_category(), "mkdtemp " + tmpl);
        return TempDirScope(std::filesystem::path(buf.data()));
    }

private:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path root_;
};

} // namespace s3pull::test_support
