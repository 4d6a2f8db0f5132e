#include "detector/pattern_registry.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace llmdlp {

namespace {

struct BuiltinRule {
    CategoryKind kind;
    const char* pattern;
    double confidence;
    const char* description;
};

// Registration order is significant: it breaks ties between findings that
// start at the same offset.
constexpr BuiltinRule kBuiltinRules[] = {
    {CategoryKind::EMAIL,
     R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
     0.95, "Email address"},

    // Spanish mobile/landline, or North American 10-digit with optional +1
    {CategoryKind::PHONE,
     R"(\b(?:\+?34)?[6789]\d{8}\b|\b(?:\+?1)?[-.\s]?\(?\d{3}\)?[-.\s]?\d{3}[-.\s]?\d{4}\b)",
     0.85, "Phone number (ES/US)"},

    {CategoryKind::NATIONAL_ID,
     R"(\b\d{3}-\d{2}-\d{4}\b)",
     0.90, "Social Security Number (US)"},

    // Grouped-digit shape only; the Luhn validator decides
    {CategoryKind::PAYMENT_CARD,
     R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)",
     0.80, "Payment card number"},

    // Dotted-quad shape; octet range checked by the IPv4 validator
    {CategoryKind::IP_ADDRESS,
     R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
     0.70, "IPv4 address"},

    {CategoryKind::IBAN,
     R"(\b[A-Z]{2}\d{2}[A-Z0-9]{1,30}\b)",
     0.75, "IBAN (international bank account)"},

    {CategoryKind::API_KEY,
     R"(\b[A-Za-z0-9_-]{32,}\b)",
     0.60, "Generic API key"},

    {CategoryKind::CLOUD_ACCESS_KEY,
     R"(\bAKIA[0-9A-Z]{16}\b)",
     0.95, "AWS access key"},

    {CategoryKind::PRIVATE_KEY,
     R"(-----BEGIN (?:RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----)",
     0.99, "Cryptographic private key"},

    {CategoryKind::PASSPORT,
     R"(\b[A-Z]{1,2}\d{6,9}\b)",
     0.65, "Passport number"},
};

} // anonymous namespace

PatternRegistry PatternRegistry::with_builtin_rules() {
    PatternRegistry registry;
    for (const auto& rule : kBuiltinRules) {
        registry.register_rule(Category::builtin(rule.kind), rule.pattern,
                               rule.confidence, rule.description);
    }
    return registry;
}

std::shared_ptr<const re2::RE2> PatternRegistry::compile(std::string_view pattern) {
    if (pattern.empty()) {
        throw InvalidPatternError("Detection pattern must not be empty");
    }

    re2::RE2::Options options;
    options.set_log_errors(false);

    auto re = std::make_shared<const re2::RE2>(std::string(pattern), options);
    if (!re->ok()) {
        throw InvalidPatternError(std::format(
            "Invalid detection pattern '{}': {}", pattern, re->error()));
    }
    return re;
}

bool PatternRegistry::register_rule(
    const Category& category,
    std::string_view pattern,
    double confidence,
    std::string_view description,
    std::optional<ValidatorKind> validator) {

    if (std::isnan(confidence) || confidence < 0.0 || confidence > 1.0) {
        throw InvalidConfidenceError(std::format(
            "Confidence for category '{}' must be within [0, 1], got {}",
            category.name(), confidence));
    }

    // Compile before touching rules_ so a failure leaves the registry unchanged
    auto matcher = compile(pattern);

    DetectionRule rule{
        category,
        std::string(pattern),
        std::move(matcher),
        confidence,
        description.empty()
            ? std::format("Custom pattern: {}", category.name())
            : std::string(description),
        validator.value_or(category.default_validator())
    };

    const auto it = std::find_if(rules_.begin(), rules_.end(),
        [&category](const DetectionRule& r) { return r.category == category; });

    if (it != rules_.end()) {
        *it = std::move(rule);
        return true;
    }
    rules_.push_back(std::move(rule));
    return false;
}

const DetectionRule* PatternRegistry::find(std::string_view category_name) const {
    const auto it = std::find_if(rules_.begin(), rules_.end(),
        [category_name](const DetectionRule& r) { return r.category.name() == category_name; });
    return it != rules_.end() ? &*it : nullptr;
}

} // namespace llmdlp
