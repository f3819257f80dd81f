#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace s3pull::transfer {

/**
 * Bucket ignore patterns. A bucket is excluded when its name starts with any startsWith entry,
 * ends with any endsWith entry, or contains any contains entry.
 */
struct IgnoreRuleSet {
    std::vector<std::string> startsWith;
    std::vector<std::string> endsWith;
    std::vector<std::string> contains;

    [[nodiscard]] bool empty() const noexcept {
        return startsWith.empty() && endsWith.empty() && contains.empty();
    }
};

[[nodiscard]] bool shouldInclude(std::string_view bucket, const IgnoreRuleSet& rules) noexcept;

/**
 * Describes the first rule that excludes bucket, e.g. "starts with 'cloudtrail-logs'".
 * Rules are checked in the order startsWith, endsWith, contains. nullopt when included.
 */
[[nodiscard]] std::optional<std::string> exclusionReason(std::string_view bucket,
                                                         const IgnoreRuleSet& rules);

// Names of the rule lists ("starts_with", "ends_with", "contains") holding an empty pattern.
// Empty patterns match no bucket.
[[nodiscard]] std::vector<std::string> rulesWithEmptyPattern(const IgnoreRuleSet& rules);

} // namespace s3pull::transfer
