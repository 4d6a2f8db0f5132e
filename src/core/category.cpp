#include "core/category.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace llmdlp {

namespace {

constexpr size_t kMaxCategoryNameLength = 64;

const CategoryInfo* find_info(CategoryKind kind) {
    const auto it = std::find_if(kBuiltinCategories.begin(), kBuiltinCategories.end(),
        [kind](const CategoryInfo& info) { return info.kind == kind; });
    return it != kBuiltinCategories.end() ? &*it : nullptr;
}

bool is_identifier(std::string_view name) {
    if (name.empty() || name.size() > kMaxCategoryNameLength) return false;
    if (name[0] < 'a' || name[0] > 'z') return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

} // anonymous namespace

Category Category::builtin(CategoryKind kind) {
    const auto* info = find_info(kind);
    if (!info) {
        throw InvalidCategoryError("CUSTOM is not a built-in category kind");
    }
    return Category(kind, std::string(info->name));
}

std::optional<Category> Category::from_builtin_name(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    for (const auto& info : kBuiltinCategories) {
        if (info.name == lower) {
            return Category(info.kind, std::string(info.name));
        }
    }
    return std::nullopt;
}

Category Category::custom(std::string_view name) {
    if (auto builtin_cat = from_builtin_name(name)) {
        return *builtin_cat;
    }
    std::string lower = utils::to_lower(name);
    if (!is_identifier(lower)) {
        throw InvalidCategoryError(std::format(
            "Invalid category name '{}': expected [a-z][a-z0-9_]* up to {} characters",
            name, kMaxCategoryNameLength));
    }
    return Category(CategoryKind::CUSTOM, std::move(lower));
}

SeverityTier Category::tier() const noexcept {
    const auto* info = find_info(kind_);
    return info ? info->tier : SeverityTier::LOW;
}

ValidatorKind Category::default_validator() const noexcept {
    const auto* info = find_info(kind_);
    return info ? info->validator : ValidatorKind::ACCEPT;
}

std::string Category::marker_name() const {
    return utils::to_upper(name_);
}

const char* validator_kind_to_string(ValidatorKind kind) {
    switch (kind) {
        case ValidatorKind::ACCEPT: return "accept";
        case ValidatorKind::LUHN: return "luhn";
        case ValidatorKind::IPV4: return "ipv4";
        case ValidatorKind::EMAIL_DOMAIN: return "email_domain";
        case ValidatorKind::CREDENTIAL: return "credential";
        default: return "unknown";
    }
}

std::optional<ValidatorKind> parse_validator_kind(std::string_view name) {
    const std::string lower = utils::to_lower(name);

    static const std::array<std::pair<std::string_view, ValidatorKind>, 5> lookup = {{
        {"accept",       ValidatorKind::ACCEPT},
        {"luhn",         ValidatorKind::LUHN},
        {"ipv4",         ValidatorKind::IPV4},
        {"email_domain", ValidatorKind::EMAIL_DOMAIN},
        {"credential",   ValidatorKind::CREDENTIAL},
    }};

    for (const auto& [key, kind] : lookup) {
        if (key == lower) return kind;
    }
    return std::nullopt;
}

} // namespace llmdlp
