#include <s3pull/core/size_format.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>

namespace s3pull {

std::string formatSize(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    for (const char* unit : kUnits) {
        if (value < 1024.0) {
            return fmt::format("{:.0f}{}", value, unit);
        }
        value /= 1024.0;
    }
    return fmt::format("{:.0f}PB", value);
}

int percentOf(std::uint64_t done, std::uint64_t total) noexcept {
    if (total == 0)
        return 0;
    return static_cast<int>((static_cast<long double>(done) * 100.0L) /
                            static_cast<long double>(total));
}

} // namespace s3pull
