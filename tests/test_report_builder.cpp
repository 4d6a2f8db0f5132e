#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "report/report_builder.hpp"

#include <string>

using namespace llmdlp;

namespace {

const std::string kRule(50, '=');

FindingSet sample_findings() {
    const auto email = Category::builtin(CategoryKind::EMAIL);
    const auto card = Category::builtin(CategoryKind::PAYMENT_CARD);
    return {
        Finding(email, "bob@corp.io", 0, 11, 0.95),
        Finding(card, "4532015112830366", 20, 36, 0.8),
        Finding(email, "eve@corp.io", 40, 51, 0.95),
    };
}

} // namespace

// ============================================================================
// Result assembly
// ============================================================================

TEST_CASE("ReportBuilder: empty input result", "[report]") {
    const auto result = ReportBuilder::build_input({}, RiskLevel::NONE);

    CHECK_FALSE(result.has_findings);
    CHECK(result.finding_count == 0);
    CHECK(result.categories_found.empty());
    CHECK(result.findings.empty());
    CHECK(result.risk_level == RiskLevel::NONE);
}

TEST_CASE("ReportBuilder: categories listed once in first-occurrence order", "[report]") {
    const auto result = ReportBuilder::build_input(sample_findings(), RiskLevel::HIGH);

    CHECK(result.has_findings);
    CHECK(result.finding_count == 3);
    REQUIRE(result.categories_found.size() == 2);
    CHECK(result.categories_found[0].name() == "email");
    CHECK(result.categories_found[1].name() == "credit_card");

    REQUIRE(result.findings.size() == 3);
    CHECK(result.findings[1].start == 20);
    CHECK(result.findings[1].end == 36);
    CHECK(result.findings[1].confidence == Catch::Approx(0.8));
}

TEST_CASE("ReportBuilder: output result carries redaction details", "[report]") {
    const auto result = ReportBuilder::build_output(
        sample_findings(), RiskLevel::HIGH, "sanitized", RedactionMode::TOKENIZE);

    CHECK(result.sanitized_text == "sanitized");
    CHECK(result.redaction_count == 3);
    CHECK(result.redaction_mode == RedactionMode::TOKENIZE);
    CHECK(result.finding_count == 3);
}

// ============================================================================
// Text rendering
// ============================================================================

TEST_CASE("ReportBuilder: clean result renders a single line", "[report]") {
    const auto result = ReportBuilder::build_input({}, RiskLevel::NONE);
    CHECK(ReportBuilder::render(result) == "No sensitive data detected.\n");
}

TEST_CASE("ReportBuilder: alert report layout", "[report]") {
    const auto result = ReportBuilder::build_input(sample_findings(), RiskLevel::HIGH);

    const std::string expected =
        "DLP ALERT - Sensitive Data Detected\n" + kRule + "\n\n"
        "Risk level: HIGH\n"
        "Categories detected: 2\n"
        "Total findings: 3\n\n"
        "Details:\n"
        "  - email: 2 finding(s)\n"
        "  - credit_card: 1 finding(s)\n"
        "\n" + kRule + "\n"
        "ACTION REQUIRED: Review and sanitize the content before proceeding.\n";

    CHECK(ReportBuilder::render(result) == expected);
}

TEST_CASE("ReportBuilder: output report mentions redactions", "[report]") {
    const auto result = ReportBuilder::build_output(
        sample_findings(), RiskLevel::HIGH, "x", RedactionMode::MASK);

    const auto report = ReportBuilder::render(result);
    CHECK(report.find("Redactions applied: 3 (mode: mask)") != std::string::npos);
    CHECK(report.find("ACTION REQUIRED") != std::string::npos);
}

TEST_CASE("ReportBuilder: rendering is deterministic", "[report]") {
    const auto result = ReportBuilder::build_input(sample_findings(), RiskLevel::HIGH);
    CHECK(ReportBuilder::render(result) == ReportBuilder::render(result));
}

// ============================================================================
// JSON rendering
// ============================================================================

TEST_CASE("ReportBuilder: JSON input result", "[report][json]") {
    const auto result = ReportBuilder::build_input(sample_findings(), RiskLevel::HIGH);
    const auto doc = ReportBuilder::to_json(result);

    CHECK(doc["has_findings"] == true);
    CHECK(doc["finding_count"] == 3);
    CHECK(doc["risk_level"] == "high");
    REQUIRE(doc["categories_found"].size() == 2);
    CHECK(doc["categories_found"][0] == "email");
    REQUIRE(doc["findings"].size() == 3);
    CHECK(doc["findings"][1]["category"] == "credit_card");
    CHECK(doc["findings"][1]["start"] == 20);
    CHECK(doc["findings"][1]["end"] == 36);
    CHECK(doc["findings"][0]["confidence"].get<double>() == Catch::Approx(0.95));
    CHECK_FALSE(doc.contains("sanitized_text"));
}

TEST_CASE("ReportBuilder: JSON output result", "[report][json]") {
    const auto result = ReportBuilder::build_output(
        sample_findings(), RiskLevel::HIGH, "[REDACTED_EMAIL]", RedactionMode::MASK);
    const auto doc = ReportBuilder::to_json(result);

    CHECK(doc["sanitized_text"] == "[REDACTED_EMAIL]");
    CHECK(doc["redaction_count"] == 3);
    CHECK(doc["redaction_mode"] == "mask");
    CHECK(doc["risk_level"] == "high");
}
