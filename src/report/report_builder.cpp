#include "report/report_builder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace llmdlp {

static constexpr std::string_view kRule =
    "==================================================";

void ReportBuilder::fill(ScanResult& result, const FindingSet& findings, RiskLevel risk) {
    result.has_findings = !findings.empty();
    result.finding_count = findings.size();
    result.risk_level = risk;
    result.findings.reserve(findings.size());

    for (const auto& finding : findings) {
        result.findings.push_back(
            {finding.category, finding.start, finding.end, finding.confidence});

        const bool seen = std::find(result.categories_found.begin(),
                                    result.categories_found.end(),
                                    finding.category) != result.categories_found.end();
        if (!seen) {
            result.categories_found.push_back(finding.category);
        }
    }
}

ScanResult ReportBuilder::build_input(const FindingSet& findings, RiskLevel risk) {
    ScanResult result;
    fill(result, findings, risk);
    return result;
}

OutputScanResult ReportBuilder::build_output(
    const FindingSet& findings, RiskLevel risk,
    std::string sanitized_text, RedactionMode mode) {

    OutputScanResult result;
    fill(result, findings, risk);
    result.sanitized_text = std::move(sanitized_text);
    result.redaction_count = findings.size();
    result.redaction_mode = mode;
    return result;
}

// ============================================================================
// Text rendering
// ============================================================================

std::string ReportBuilder::render_body(const ScanResult& result, const OutputScanResult* output) {
    if (!result.has_findings) {
        return "No sensitive data detected.\n";
    }

    std::string report;
    report += "DLP ALERT - Sensitive Data Detected\n";
    report += kRule;
    report += "\n\n";
    report += std::format("Risk level: {}\n",
                          utils::to_upper(risk_level_to_string(result.risk_level)));
    report += std::format("Categories detected: {}\n", result.categories_found.size());
    report += std::format("Total findings: {}\n\n", result.finding_count);

    report += "Details:\n";
    for (const auto& category : result.categories_found) {
        const auto count = std::count_if(result.findings.begin(), result.findings.end(),
            [&category](const FindingSummary& f) { return f.category == category; });
        report += std::format("  - {}: {} finding(s)\n", category.name(), count);
    }

    if (output) {
        report += std::format("\nRedactions applied: {} (mode: {})\n",
                              output->redaction_count,
                              redaction_mode_to_string(output->redaction_mode));
    }

    report += "\n";
    report += kRule;
    report += "\nACTION REQUIRED: Review and sanitize the content before proceeding.\n";
    return report;
}

std::string ReportBuilder::render(const ScanResult& result) {
    return render_body(result, nullptr);
}

std::string ReportBuilder::render(const OutputScanResult& result) {
    return render_body(result, &result);
}

// ============================================================================
// JSON rendering
// ============================================================================

nlohmann::json ReportBuilder::to_json(const ScanResult& result) {
    nlohmann::json doc;
    doc["has_findings"] = result.has_findings;
    doc["finding_count"] = result.finding_count;
    doc["risk_level"] = risk_level_to_string(result.risk_level);

    auto categories = nlohmann::json::array();
    for (const auto& category : result.categories_found) {
        categories.push_back(category.name());
    }
    doc["categories_found"] = std::move(categories);

    auto findings = nlohmann::json::array();
    for (const auto& f : result.findings) {
        findings.push_back({
            {"category", f.category.name()},
            {"start", f.start},
            {"end", f.end},
            {"confidence", f.confidence}
        });
    }
    doc["findings"] = std::move(findings);
    return doc;
}

nlohmann::json ReportBuilder::to_json(const OutputScanResult& result) {
    auto doc = to_json(static_cast<const ScanResult&>(result));
    doc["sanitized_text"] = result.sanitized_text;
    doc["redaction_count"] = result.redaction_count;
    doc["redaction_mode"] = redaction_mode_to_string(result.redaction_mode);
    return doc;
}

} // namespace llmdlp
