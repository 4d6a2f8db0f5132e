#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace llmdlp {

/**
 * @brief Assembles scan results and renders them for operators
 *
 * Rendering is deterministic for identical inputs; per-category counts are
 * listed in first-occurrence order.
 */
class ReportBuilder {
public:
    [[nodiscard]] static ScanResult build_input(
        const FindingSet& findings, RiskLevel risk);

    [[nodiscard]] static OutputScanResult build_output(
        const FindingSet& findings, RiskLevel risk,
        std::string sanitized_text, RedactionMode mode);

    /**
     * @brief Plain-text summary: banner, risk level, per-category counts,
     *        action-required footer
     */
    [[nodiscard]] static std::string render(const ScanResult& result);
    [[nodiscard]] static std::string render(const OutputScanResult& result);

    [[nodiscard]] static nlohmann::json to_json(const ScanResult& result);
    [[nodiscard]] static nlohmann::json to_json(const OutputScanResult& result);

private:
    static void fill(ScanResult& result, const FindingSet& findings, RiskLevel risk);
    static std::string render_body(const ScanResult& result, const OutputScanResult* output);
};

} // namespace llmdlp
