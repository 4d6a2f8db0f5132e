#pragma once

#include "core/category.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace llmdlp {

struct ValidatorConfig {
    // Placeholder domains never reported as real addresses
    std::vector<std::string> email_denylist = {"example.com", "test.com", "domain.com"};
    size_t credential_min_length = 32;
};

/**
 * @brief Per-category false-positive filters
 *
 * Every check is a pure function of the raw match (plus immutable config),
 * so one instance is shared across concurrent scans without locking.
 *
 * - LUHN:         strip '-' and ' ', digits only, Luhn checksum
 * - IPV4:         exactly four '.'-separated integers in [0, 255]
 * - EMAIL_DOMAIN: domain must not contain a denylisted placeholder domain
 * - CREDENTIAL:   at least one letter, one digit, and the minimum length
 * - ACCEPT:       always valid
 */
class CategoryValidators {
public:
    CategoryValidators() : CategoryValidators(ValidatorConfig{}) {}
    explicit CategoryValidators(ValidatorConfig config);

    /**
     * @brief Validate with the category's default validator
     */
    [[nodiscard]] bool validate(const Category& category, std::string_view raw) const;

    /**
     * @brief Validate with an explicit validator kind
     */
    [[nodiscard]] bool validate(ValidatorKind kind, std::string_view raw) const;

    [[nodiscard]] static bool luhn_valid(std::string_view raw);
    [[nodiscard]] static bool ipv4_valid(std::string_view raw);
    [[nodiscard]] bool email_domain_allowed(std::string_view raw) const;
    [[nodiscard]] bool credential_plausible(std::string_view raw) const;

    [[nodiscard]] const ValidatorConfig& config() const noexcept { return config_; }

private:
    ValidatorConfig config_;   // denylist entries stored lowercase
};

} // namespace llmdlp
