#pragma once

#include "core/types.hpp"
#include "detector/category_validators.hpp"
#include "detector/pattern_registry.hpp"

#include <string_view>
#include <vector>

namespace llmdlp {

/**
 * @brief Runs every detection rule over a text and merges validated matches
 *
 * Per rule: leftmost-first, non-overlapping scan resuming at each match end;
 * each occurrence is kept iff the rule's validator accepts it. Results from
 * all rules are merged with a stable sort on start offset, so ties keep
 * registration order. Overlapping spans from different categories are
 * reported as-is.
 *
 * Rules only read the immutable text and tables, so large inputs are scanned
 * with one task per rule; the merge waits for every task.
 */
class MatchCollector {
public:
    struct Options {
        bool parallel = true;
        size_t parallel_threshold_bytes = 4096;
    };

    MatchCollector(const PatternRegistry& registry,
                   const CategoryValidators& validators)
        : MatchCollector(registry, validators, Options{}) {}

    MatchCollector(const PatternRegistry& registry,
                   const CategoryValidators& validators,
                   Options options)
        : registry_(registry), validators_(validators), options_(options) {}

    [[nodiscard]] FindingSet find_all(std::string_view text) const;

    /**
     * @brief Scan for a single rule (no merge)
     */
    [[nodiscard]] std::vector<Finding> scan_rule(
        const DetectionRule& rule, std::string_view text) const;

private:
    const PatternRegistry& registry_;
    const CategoryValidators& validators_;
    Options options_;
};

} // namespace llmdlp
