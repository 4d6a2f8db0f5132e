#include <catch2/catch_test_macros.hpp>
#include "detector/risk_classifier.hpp"

#include <algorithm>
#include <initializer_list>

using namespace llmdlp;

namespace {

FindingSet findings_of(std::initializer_list<Category> categories) {
    FindingSet findings;
    size_t offset = 0;
    for (const auto& cat : categories) {
        findings.emplace_back(cat, "x", offset, offset + 1, 0.9);
        offset += 2;
    }
    return findings;
}

const Category kCard = Category::builtin(CategoryKind::PAYMENT_CARD);
const Category kSsn = Category::builtin(CategoryKind::NATIONAL_ID);
const Category kEmail = Category::builtin(CategoryKind::EMAIL);
const Category kPhone = Category::builtin(CategoryKind::PHONE);
const Category kIp = Category::builtin(CategoryKind::IP_ADDRESS);

} // namespace

TEST_CASE("RiskClassifier: empty set is NONE", "[classifier]") {
    CHECK(RiskClassifier::classify({}) == RiskLevel::NONE);
}

TEST_CASE("RiskClassifier: high-tier thresholds", "[classifier]") {
    CHECK(RiskClassifier::classify(findings_of({kCard})) == RiskLevel::HIGH);
    CHECK(RiskClassifier::classify(findings_of({kCard, kSsn})) == RiskLevel::CRITICAL);
    // Two occurrences of the same high-tier category also count twice
    CHECK(RiskClassifier::classify(findings_of({kCard, kCard})) == RiskLevel::CRITICAL);
}

TEST_CASE("RiskClassifier: medium-tier thresholds", "[classifier]") {
    CHECK(RiskClassifier::classify(findings_of({kEmail})) == RiskLevel::MEDIUM);
    CHECK(RiskClassifier::classify(findings_of({kEmail, kPhone})) == RiskLevel::MEDIUM);
    CHECK(RiskClassifier::classify(findings_of({kEmail, kPhone, kEmail})) == RiskLevel::HIGH);
}

TEST_CASE("RiskClassifier: low tier only", "[classifier]") {
    CHECK(RiskClassifier::classify(findings_of({kIp})) == RiskLevel::LOW);
    CHECK(RiskClassifier::classify(findings_of({kIp, kIp, kIp, kIp})) == RiskLevel::LOW);
    CHECK(RiskClassifier::classify(findings_of({Category::custom("employee_id")})) == RiskLevel::LOW);
}

TEST_CASE("RiskClassifier: high tier dominates medium count", "[classifier]") {
    CHECK(RiskClassifier::classify(findings_of({kEmail, kPhone, kEmail, kCard})) == RiskLevel::HIGH);
    CHECK(RiskClassifier::classify(findings_of({kIp, kEmail})) == RiskLevel::MEDIUM);
}

TEST_CASE("RiskClassifier: result ignores order", "[classifier]") {
    auto findings = findings_of({kIp, kEmail, kCard, kPhone});
    const auto expected = RiskClassifier::classify(findings);

    std::reverse(findings.begin(), findings.end());
    CHECK(RiskClassifier::classify(findings) == expected);
}

TEST_CASE("RiskLevel is totally ordered", "[classifier]") {
    CHECK(RiskLevel::NONE < RiskLevel::LOW);
    CHECK(RiskLevel::LOW < RiskLevel::MEDIUM);
    CHECK(RiskLevel::MEDIUM < RiskLevel::HIGH);
    CHECK(RiskLevel::HIGH < RiskLevel::CRITICAL);
    CHECK(std::string(risk_level_to_string(RiskLevel::CRITICAL)) == "critical");
}
