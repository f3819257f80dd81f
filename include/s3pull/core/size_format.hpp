#pragma once

#include <cstdint>
#include <string>

namespace s3pull {

// Human-readable size in binary units with no decimals: 0B, 1023B, 1KB, 34MB, 5GB.
std::string formatSize(std::uint64_t bytes);

// Integer percentage of done/total, 0 when total is 0.
int percentOf(std::uint64_t done, std::uint64_t total) noexcept;

} // namespace s3pull
