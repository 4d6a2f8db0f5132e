#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "detector/category_validators.hpp"
#include "detector/pattern_registry.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace llmdlp {

/**
 * @brief DLP scanner - inspects prompts and completions for sensitive data
 *
 * Pipeline per scan:
 *   text -> MatchCollector (registry + validators) -> FindingSet
 *        -> RiskClassifier, Redactor (output scans) -> ReportBuilder
 *
 * Thread-safety: scans are const and may run concurrently without limit.
 * The pattern registry is published RCU-style (atomic shared_ptr); a scan
 * loads one snapshot and uses it for its whole duration, while
 * register_category() builds a modified copy under a writer mutex and swaps
 * it in. The default redaction mode is read once per scan and passed down
 * explicitly.
 */
class DlpScanner {
public:
    /**
     * @brief Scanner with built-in rules and default settings
     */
    DlpScanner();

    /**
     * @brief Scanner configured from a loaded config
     * @throws DlpError if a configured category or the redaction mode is invalid
     */
    explicit DlpScanner(const DlpConfig& config);

    /**
     * @brief Scan an inbound prompt
     * @throws InputTooLargeError if text exceeds max_input_bytes
     */
    [[nodiscard]] ScanResult scan_input(std::string_view text) const;

    /**
     * @brief Scan a completion and redact with the current default mode
     * @throws InputTooLargeError if text exceeds max_input_bytes
     */
    [[nodiscard]] OutputScanResult scan_output(std::string_view text) const;

    /**
     * @brief Scan a completion and redact with an explicit mode
     */
    [[nodiscard]] OutputScanResult scan_output(std::string_view text, RedactionMode mode) const;

    /**
     * @brief Set the default redaction mode used by scan_output(text)
     */
    void set_redaction_mode(RedactionMode mode) noexcept;

    /**
     * @brief Set the default redaction mode by name
     * @throws UnsupportedModeError for anything other than mask/remove/tokenize;
     *         the current mode is left unchanged
     */
    void set_redaction_mode(std::string_view mode);

    [[nodiscard]] RedactionMode redaction_mode() const noexcept;

    /**
     * @brief Register (or replace) a detection rule (administrative)
     *
     * Built-in names resolve to the built-in category; any other valid
     * identifier creates a custom category. In-flight scans keep the
     * snapshot they started with.
     * @return The category the rule was registered under
     * @throws InvalidCategoryError, InvalidPatternError, InvalidConfidenceError
     */
    Category register_category(
        std::string_view name,
        std::string_view pattern,
        double confidence,
        std::string_view description = {},
        std::optional<ValidatorKind> validator = std::nullopt);

    /**
     * @brief Human-readable summary of a scan result
     */
    [[nodiscard]] static std::string render_report(const ScanResult& result);
    [[nodiscard]] static std::string render_report(const OutputScanResult& result);

    /**
     * @brief Current registry snapshot
     */
    [[nodiscard]] std::shared_ptr<const PatternRegistry> registry() const;

    [[nodiscard]] const ScannerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] FindingSet collect(std::string_view text) const;
    void check_input_size(std::string_view text) const;

    ScannerConfig config_;
    CategoryValidators validators_;

    // RCU: readers load the snapshot atomically, writers copy and swap
    std::atomic<std::shared_ptr<const PatternRegistry>> registry_;
    std::atomic<RedactionMode> default_mode_{RedactionMode::MASK};

    // Mutex for registration (single writer)
    mutable std::mutex register_mutex_;
};

} // namespace llmdlp
