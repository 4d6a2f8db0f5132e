#include "scanner/dlp_scanner.hpp"
#include "core/redactor.hpp"
#include "core/utils.hpp"
#include "detector/match_collector.hpp"
#include "detector/risk_classifier.hpp"
#include "report/report_builder.hpp"

#include <format>

namespace llmdlp {

DlpScanner::DlpScanner() : DlpScanner(DlpConfig{}) {}

DlpScanner::DlpScanner(const DlpConfig& config)
    : config_(config.scanner),
      validators_(config.validators) {

    const auto mode = parse_redaction_mode(config_.redaction_mode);
    if (mode.is_error()) {
        throw UnsupportedModeError(mode.error_message());
    }
    default_mode_.store(mode.value(), std::memory_order_relaxed);

    // Configured categories fail construction, never a later scan
    auto registry = PatternRegistry::with_builtin_rules();
    for (const auto& cat : config.categories) {
        std::optional<ValidatorKind> validator;
        if (!cat.validator.empty()) {
            validator = parse_validator_kind(cat.validator);
            if (!validator) {
                throw InvalidCategoryError(std::format(
                    "Unknown validator '{}' for category '{}'", cat.validator, cat.name));
            }
        }
        const auto category = Category::custom(cat.name);
        const bool replaced = registry.register_rule(
            category, cat.pattern, cat.confidence, cat.description, validator);
        utils::log::info(std::format("{} detection rule for category '{}'",
                                     replaced ? "Replaced" : "Registered", category.name()));
    }

    registry_.store(std::make_shared<const PatternRegistry>(std::move(registry)),
                    std::memory_order_release);
}

// ============================================================================
// Scans
// ============================================================================

void DlpScanner::check_input_size(std::string_view text) const {
    if (text.size() > config_.max_input_bytes) {
        throw InputTooLargeError(std::format(
            "Scan input of {} bytes exceeds the {} byte limit",
            text.size(), config_.max_input_bytes));
    }
}

FindingSet DlpScanner::collect(std::string_view text) const {
    check_input_size(text);

    // One snapshot for the whole scan
    const auto registry = registry_.load(std::memory_order_acquire);

    MatchCollector collector(*registry, validators_,
        {config_.parallel_categories, config_.parallel_threshold_bytes});
    return collector.find_all(text);
}

ScanResult DlpScanner::scan_input(std::string_view text) const {
    utils::Timer timer;
    const auto findings = collect(text);
    const auto risk = RiskClassifier::classify(findings);

    utils::log::debug(std::format("Input scan: {} bytes, {} findings, risk {} ({}us)",
        text.size(), findings.size(), risk_level_to_string(risk), timer.elapsed_us().count()));

    return ReportBuilder::build_input(findings, risk);
}

OutputScanResult DlpScanner::scan_output(std::string_view text) const {
    return scan_output(text, default_mode_.load(std::memory_order_acquire));
}

OutputScanResult DlpScanner::scan_output(std::string_view text, RedactionMode mode) const {
    utils::Timer timer;
    const auto findings = collect(text);
    const auto risk = RiskClassifier::classify(findings);
    auto sanitized = Redactor::redact(text, findings, mode);

    utils::log::debug(std::format("Output scan: {} bytes, {} redactions ({}), risk {} ({}us)",
        text.size(), findings.size(), redaction_mode_to_string(mode),
        risk_level_to_string(risk), timer.elapsed_us().count()));

    return ReportBuilder::build_output(findings, risk, std::move(sanitized), mode);
}

// ============================================================================
// Administration
// ============================================================================

void DlpScanner::set_redaction_mode(RedactionMode mode) noexcept {
    default_mode_.store(mode, std::memory_order_release);
}

void DlpScanner::set_redaction_mode(std::string_view mode) {
    const auto parsed = parse_redaction_mode(mode);
    if (parsed.is_error()) {
        throw UnsupportedModeError(parsed.error_message());
    }
    set_redaction_mode(parsed.value());
    utils::log::info(std::format("Default redaction mode set to {}",
                                 redaction_mode_to_string(parsed.value())));
}

RedactionMode DlpScanner::redaction_mode() const noexcept {
    return default_mode_.load(std::memory_order_acquire);
}

Category DlpScanner::register_category(
    std::string_view name,
    std::string_view pattern,
    double confidence,
    std::string_view description,
    std::optional<ValidatorKind> validator) {

    const auto category = Category::custom(name);

    std::lock_guard<std::mutex> lock(register_mutex_);
    auto updated = std::make_shared<PatternRegistry>(*registry_.load(std::memory_order_acquire));

    // Throws before publishing; the current snapshot stays in place
    const bool replaced = updated->register_rule(category, pattern, confidence,
                                                 description, validator);

    const ValidatorKind applied = updated->find(category.name())->validator;
    registry_.store(std::move(updated), std::memory_order_release);

    if (replaced) {
        utils::log::warn(std::format("Detection rule for category '{}' replaced", category.name()));
    } else {
        utils::log::info(std::format("Registered detection rule for {} category '{}' (validator: {})",
                                     category.is_custom() ? "custom" : "built-in",
                                     category.name(), validator_kind_to_string(applied)));
    }
    return category;
}

std::shared_ptr<const PatternRegistry> DlpScanner::registry() const {
    return registry_.load(std::memory_order_acquire);
}

std::string DlpScanner::render_report(const ScanResult& result) {
    return ReportBuilder::render(result);
}

std::string DlpScanner::render_report(const OutputScanResult& result) {
    return ReportBuilder::render(result);
}

} // namespace llmdlp
