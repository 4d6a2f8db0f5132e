#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "detector/pattern_registry.hpp"

#include <limits>

using namespace llmdlp;

TEST_CASE("PatternRegistry: built-in rules in registration order", "[registry]") {
    const auto registry = PatternRegistry::with_builtin_rules();

    REQUIRE(registry.size() == 10);
    CHECK(registry.rules().front().category.name() == "email");
    CHECK(registry.rules()[1].category.name() == "phone_number");
    CHECK(registry.rules()[3].category.name() == "credit_card");
    CHECK(registry.rules().back().category.name() == "passport_number");

    for (const auto& rule : registry.rules()) {
        CHECK(rule.matcher != nullptr);
        CHECK(rule.matcher->ok());
        CHECK(rule.base_confidence > 0.0);
        CHECK(rule.base_confidence <= 1.0);
        CHECK_FALSE(rule.description.empty());
    }
}

TEST_CASE("PatternRegistry: built-in validators follow the category", "[registry]") {
    const auto registry = PatternRegistry::with_builtin_rules();

    REQUIRE(registry.find("credit_card") != nullptr);
    CHECK(registry.find("credit_card")->validator == ValidatorKind::LUHN);
    CHECK(registry.find("ip_address")->validator == ValidatorKind::IPV4);
    CHECK(registry.find("email")->validator == ValidatorKind::EMAIL_DOMAIN);
    CHECK(registry.find("api_key")->validator == ValidatorKind::CREDENTIAL);
    CHECK(registry.find("passport_number")->validator == ValidatorKind::ACCEPT);
    CHECK(registry.find("person_name") == nullptr);
}

TEST_CASE("PatternRegistry: register a custom category", "[registry]") {
    PatternRegistry registry;
    const bool replaced = registry.register_rule(
        Category::custom("employee_id"), R"(\bEMP-\d{6}\b)", 0.9);

    CHECK_FALSE(replaced);
    REQUIRE(registry.size() == 1);

    const auto* rule = registry.find("employee_id");
    REQUIRE(rule != nullptr);
    CHECK(rule->pattern == R"(\bEMP-\d{6}\b)");
    CHECK(rule->base_confidence == 0.9);
    CHECK(rule->description == "Custom pattern: employee_id");
    CHECK(rule->validator == ValidatorKind::ACCEPT);
}

TEST_CASE("PatternRegistry: explicit validator overrides the default", "[registry]") {
    PatternRegistry registry;
    registry.register_rule(Category::custom("loyalty_card"), R"(\b\d{16}\b)", 0.7,
                           "Loyalty card", ValidatorKind::LUHN);

    const auto* rule = registry.find("loyalty_card");
    REQUIRE(rule != nullptr);
    CHECK(rule->validator == ValidatorKind::LUHN);
    CHECK(rule->description == "Loyalty card");
}

TEST_CASE("PatternRegistry: re-registering replaces in place", "[registry]") {
    auto registry = PatternRegistry::with_builtin_rules();

    const bool replaced = registry.register_rule(
        Category::builtin(CategoryKind::EMAIL), R"(\b\w+@corp\.io\b)", 0.5);

    CHECK(replaced);
    CHECK(registry.size() == 10);
    CHECK(registry.rules().front().category.name() == "email");
    CHECK(registry.rules().front().pattern == R"(\b\w+@corp\.io\b)");
    CHECK(registry.rules().front().base_confidence == 0.5);
}

TEST_CASE("PatternRegistry: invalid patterns are rejected", "[registry]") {
    PatternRegistry registry;
    const auto cat = Category::custom("broken");

    SECTION("Unbalanced group") {
        CHECK_THROWS_AS(registry.register_rule(cat, "(abc", 0.5), InvalidPatternError);
    }

    SECTION("Empty pattern") {
        CHECK_THROWS_AS(registry.register_rule(cat, "", 0.5), InvalidPatternError);
    }

    SECTION("Backreferences are not supported by the linear-time engine") {
        CHECK_THROWS_AS(registry.register_rule(cat, R"((a)\1)", 0.5), InvalidPatternError);
    }

    CHECK(registry.empty());
}

TEST_CASE("PatternRegistry: failed replacement keeps the old rule", "[registry]") {
    auto registry = PatternRegistry::with_builtin_rules();
    const auto before = registry.find("email")->pattern;

    CHECK_THROWS_AS(registry.register_rule(Category::builtin(CategoryKind::EMAIL), "[", 0.5),
                    InvalidPatternError);
    CHECK(registry.find("email")->pattern == before);
}

TEST_CASE("PatternRegistry: confidence must be within [0, 1]", "[registry]") {
    PatternRegistry registry;
    const auto cat = Category::custom("badge");

    CHECK_THROWS_AS(registry.register_rule(cat, "x", 1.5), InvalidConfidenceError);
    CHECK_THROWS_AS(registry.register_rule(cat, "x", -0.1), InvalidConfidenceError);
    CHECK_THROWS_AS(registry.register_rule(cat, "x",
                    std::numeric_limits<double>::quiet_NaN()), InvalidConfidenceError);
    CHECK(registry.empty());

    CHECK_NOTHROW(registry.register_rule(cat, "x", 0.0));
    CHECK_NOTHROW(registry.register_rule(cat, "x", 1.0));
}

TEST_CASE("PatternRegistry: copies are independent snapshots", "[registry]") {
    const auto original = PatternRegistry::with_builtin_rules();
    auto copy = original;

    copy.register_rule(Category::custom("employee_id"), R"(EMP-\d+)", 0.9);

    CHECK(original.size() == 10);
    CHECK(copy.size() == 11);
    CHECK(original.find("employee_id") == nullptr);
    // Compiled matchers are shared, not recompiled
    CHECK(copy.rules().front().matcher == original.rules().front().matcher);
}
