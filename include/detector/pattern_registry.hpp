#pragma once

#include "core/category.hpp"

#include <re2/re2.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmdlp {

/**
 * @brief Detection rule for one category
 *
 * The matcher is compiled once at registration and shared (read-only)
 * between registry copies.
 */
struct DetectionRule {
    Category category;
    std::string pattern;
    std::shared_ptr<const re2::RE2> matcher;
    double base_confidence = 0.0;
    std::string description;
    ValidatorKind validator = ValidatorKind::ACCEPT;
};

/**
 * @brief Category -> DetectionRule table, in registration order
 *
 * A registry is a plain value: copying it is cheap (matchers are shared)
 * and the scanner publishes copies as immutable snapshots. Registering an
 * existing category replaces its rule in place, so registration order
 * (used to break offset ties) is preserved.
 */
class PatternRegistry {
public:
    PatternRegistry() = default;

    /**
     * @brief Registry preloaded with the built-in rules
     */
    [[nodiscard]] static PatternRegistry with_builtin_rules();

    /**
     * @brief Register or replace the rule for a category
     * @param validator Validator kind; defaults to the category's own
     * @return true if an existing rule was replaced
     * @throws InvalidPatternError if pattern is empty or does not compile
     * @throws InvalidConfidenceError if confidence is NaN or outside [0, 1]
     */
    bool register_rule(
        const Category& category,
        std::string_view pattern,
        double confidence,
        std::string_view description = {},
        std::optional<ValidatorKind> validator = std::nullopt);

    [[nodiscard]] const std::vector<DetectionRule>& rules() const noexcept { return rules_; }

    [[nodiscard]] const DetectionRule* find(std::string_view category_name) const;

    [[nodiscard]] size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

private:
    static std::shared_ptr<const re2::RE2> compile(std::string_view pattern);

    std::vector<DetectionRule> rules_;
};

} // namespace llmdlp
