#include <s3pull/transfer/bucket_filter.hpp>

#include <algorithm>

namespace s3pull::transfer {

namespace {

enum class RuleKind { StartsWith, EndsWith, Contains };

struct Match {
    RuleKind kind;
    const std::string* pattern;
};

// Empty patterns never match; an empty YAML entry must not drop every bucket
std::optional<Match> firstMatch(std::string_view bucket, const IgnoreRuleSet& rules) noexcept {
    for (const auto& p : rules.startsWith) {
        if (!p.empty() && bucket.starts_with(p))
            return Match{RuleKind::StartsWith, &p};
    }
    for (const auto& p : rules.endsWith) {
        if (!p.empty() && bucket.ends_with(p))
            return Match{RuleKind::EndsWith, &p};
    }
    for (const auto& p : rules.contains) {
        if (!p.empty() && bucket.find(p) != std::string_view::npos)
            return Match{RuleKind::Contains, &p};
    }
    return std::nullopt;
}

} // namespace

bool shouldInclude(std::string_view bucket, const IgnoreRuleSet& rules) noexcept {
    return !firstMatch(bucket, rules).has_value();
}

std::optional<std::string> exclusionReason(std::string_view bucket, const IgnoreRuleSet& rules) {
    auto m = firstMatch(bucket, rules);
    if (!m)
        return std::nullopt;
    switch (m->kind) {
        case RuleKind::StartsWith:
            return "starts with '" + *m->pattern + "'";
        case RuleKind::EndsWith:
            return "ends with '" + *m->pattern + "'";
        case RuleKind::Contains:
            return "contains '" + *m->pattern + "'";
    }
    return std::nullopt;
}

std::vector<std::string> rulesWithEmptyPattern(const IgnoreRuleSet& rules) {
    const auto hasEmpty = [](const std::vector<std::string>& list) {
        return std::any_of(list.begin(), list.end(), [](const std::string& p) { return p.empty(); });
    };
    std::vector<std::string> out;
    if (hasEmpty(rules.startsWith))
        out.emplace_back("starts_with");
    if (hasEmpty(rules.endsWith))
        out.emplace_back("ends_with");
    if (hasEmpty(rules.contains))
        out.emplace_back("contains");
    return out;
}

} // namespace s3pull::transfer
