#include "detector/category_validators.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace llmdlp {

CategoryValidators::CategoryValidators(ValidatorConfig config)
    : config_(std::move(config)) {
    for (auto& domain : config_.email_denylist) {
        domain = utils::to_lower(domain);
    }
    std::erase_if(config_.email_denylist, [](const std::string& d) { return d.empty(); });
}

bool CategoryValidators::validate(const Category& category, std::string_view raw) const {
    return validate(category.default_validator(), raw);
}

bool CategoryValidators::validate(ValidatorKind kind, std::string_view raw) const {
    switch (kind) {
        case ValidatorKind::ACCEPT:
            return true;
        case ValidatorKind::LUHN:
            return luhn_valid(raw);
        case ValidatorKind::IPV4:
            return ipv4_valid(raw);
        case ValidatorKind::EMAIL_DOMAIN:
            return email_domain_allowed(raw);
        case ValidatorKind::CREDENTIAL:
            return credential_plausible(raw);
    }
    return true;
}

bool CategoryValidators::luhn_valid(std::string_view raw) {
    int sum = 0;
    size_t digit_count = 0;
    bool double_digit = false;

    // Process from right to left, skipping separators in place
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        const char c = *it;
        if (c == '-' || c == ' ') continue;
        if (c < '0' || c > '9') return false;

        int digit = c - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
        ++digit_count;
    }

    return digit_count > 0 && (sum % 10) == 0;
}

bool CategoryValidators::ipv4_valid(std::string_view raw) {
    const auto parts = utils::split(raw, '.');
    if (parts.size() != 4) {
        return false;
    }
    return std::all_of(parts.begin(), parts.end(), [](std::string_view part) {
        const auto octet = utils::try_parse_int<unsigned>(part);
        return octet.has_value() && *octet <= 255;
    });
}

bool CategoryValidators::email_domain_allowed(std::string_view raw) const {
    const size_t at = raw.rfind('@');
    const std::string domain = utils::to_lower(
        at == std::string_view::npos ? raw : raw.substr(at + 1));

    return std::none_of(config_.email_denylist.begin(), config_.email_denylist.end(),
        [&domain](const std::string& placeholder) {
            return domain.find(placeholder) != std::string::npos;
        });
}

bool CategoryValidators::credential_plausible(std::string_view raw) const {
    if (raw.size() < config_.credential_min_length) {
        return false;
    }
    const bool has_letter = std::any_of(raw.begin(), raw.end(),
        [](char c) { return std::isalpha(static_cast<unsigned char>(c)); });
    const bool has_digit = std::any_of(raw.begin(), raw.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    return has_letter && has_digit;
}

} // namespace llmdlp
