#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace llmdlp {

/**
 * @brief Built-in sensitive-data kinds; CUSTOM covers operator-registered ones
 */
enum class CategoryKind : uint8_t {
    EMAIL,
    PHONE,
    NATIONAL_ID,
    PAYMENT_CARD,
    IP_ADDRESS,
    IBAN,
    API_KEY,
    CLOUD_ACCESS_KEY,
    PRIVATE_KEY,
    PASSPORT,
    DRIVER_LICENSE,
    PHYSICAL_ADDRESS,
    PERSON_NAME,
    CUSTOM
};

/**
 * @brief Severity tier used by the risk classifier
 */
enum class SeverityTier : uint8_t {
    LOW,
    MEDIUM,
    HIGH
};

/**
 * @brief False-positive filter applied to a raw match
 */
enum class ValidatorKind : uint8_t {
    ACCEPT,         // pattern match alone decides
    LUHN,           // payment card checksum
    IPV4,           // four octets in [0, 255]
    EMAIL_DOMAIN,   // placeholder-domain denylist
    CREDENTIAL      // letter + digit + minimum length
};

struct CategoryInfo {
    CategoryKind kind;
    std::string_view name;
    ValidatorKind validator;
    SeverityTier tier;
};

// Static behavior table for built-in kinds. Names are published identifiers
// and must never change meaning.
inline constexpr std::array<CategoryInfo, 13> kBuiltinCategories = {{
    {CategoryKind::EMAIL,            "email",                  ValidatorKind::EMAIL_DOMAIN, SeverityTier::MEDIUM},
    {CategoryKind::PHONE,            "phone_number",           ValidatorKind::ACCEPT,       SeverityTier::MEDIUM},
    {CategoryKind::NATIONAL_ID,      "social_security_number", ValidatorKind::ACCEPT,       SeverityTier::HIGH},
    {CategoryKind::PAYMENT_CARD,     "credit_card",            ValidatorKind::LUHN,         SeverityTier::HIGH},
    {CategoryKind::IP_ADDRESS,       "ip_address",             ValidatorKind::IPV4,         SeverityTier::LOW},
    {CategoryKind::IBAN,             "iban",                   ValidatorKind::ACCEPT,       SeverityTier::MEDIUM},
    {CategoryKind::API_KEY,          "api_key",                ValidatorKind::CREDENTIAL,   SeverityTier::MEDIUM},
    {CategoryKind::CLOUD_ACCESS_KEY, "aws_access_key",         ValidatorKind::ACCEPT,       SeverityTier::HIGH},
    {CategoryKind::PRIVATE_KEY,      "private_key",            ValidatorKind::ACCEPT,       SeverityTier::HIGH},
    {CategoryKind::PASSPORT,         "passport_number",        ValidatorKind::ACCEPT,       SeverityTier::HIGH},
    {CategoryKind::DRIVER_LICENSE,   "driver_license",         ValidatorKind::ACCEPT,       SeverityTier::MEDIUM},
    {CategoryKind::PHYSICAL_ADDRESS, "physical_address",       ValidatorKind::ACCEPT,       SeverityTier::LOW},
    {CategoryKind::PERSON_NAME,      "person_name",            ValidatorKind::ACCEPT,       SeverityTier::LOW},
}};

/**
 * @brief Sensitive-data category: a built-in kind or a named custom category
 *
 * Equality compares kind and name. Custom categories are created only through
 * Category::custom(), which validates the identifier up front.
 */
class Category {
public:
    /**
     * @brief Built-in category for a kind
     * @throws InvalidCategoryError for CategoryKind::CUSTOM
     */
    [[nodiscard]] static Category builtin(CategoryKind kind);

    /**
     * @brief Resolve a name to a category
     *
     * Built-in names (case-insensitive) resolve to the built-in category.
     * Any other name must match [a-z][a-z0-9_]* (max 64 bytes, after
     * lowercasing) and becomes a new CUSTOM category.
     * @throws InvalidCategoryError on an invalid identifier
     */
    [[nodiscard]] static Category custom(std::string_view name);

    /**
     * @brief Look up a built-in category by its published name
     */
    [[nodiscard]] static std::optional<Category> from_builtin_name(std::string_view name);

    [[nodiscard]] CategoryKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool is_custom() const noexcept { return kind_ == CategoryKind::CUSTOM; }

    [[nodiscard]] SeverityTier tier() const noexcept;
    [[nodiscard]] ValidatorKind default_validator() const noexcept;

    /// Uppercased name used in redaction markers ("credit_card" -> "CREDIT_CARD").
    [[nodiscard]] std::string marker_name() const;

    bool operator==(const Category& other) const = default;

private:
    Category(CategoryKind kind, std::string name)
        : kind_(kind), name_(std::move(name)) {}

    CategoryKind kind_;
    std::string name_;
};

[[nodiscard]] const char* validator_kind_to_string(ValidatorKind kind);
[[nodiscard]] std::optional<ValidatorKind> parse_validator_kind(std::string_view name);

} // namespace llmdlp
