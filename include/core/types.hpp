#pragma once

#include "core/category.hpp"
#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace llmdlp {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Discrete severity of a finding set; totally ordered
 */
enum class RiskLevel : uint8_t {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief Strategy used to replace a detected span
 */
enum class RedactionMode : uint8_t {
    MASK,       // [REDACTED_<CATEGORY>]
    REMOVE,     // empty string
    TOKENIZE    // [TOKEN_<CATEGORY>_<8 digits of XXH64>]
};

// ============================================================================
// Findings
// ============================================================================

/**
 * @brief One validated occurrence of a category at [start, end) of the text
 *
 * Offsets are byte offsets into the scanned UTF-8 text.
 */
struct Finding {
    Category category;
    std::string raw_text;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;

    Finding(Category cat, std::string raw, size_t s, size_t e, double conf)
        : category(std::move(cat)), raw_text(std::move(raw)),
          start(s), end(e), confidence(conf) {}
};

/// Findings sorted ascending by start; ties keep category registration order.
using FindingSet = std::vector<Finding>;

// ============================================================================
// Scan Results
// ============================================================================

struct FindingSummary {
    Category category;
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;
};

struct ScanResult {
    bool has_findings = false;
    size_t finding_count = 0;
    std::vector<Category> categories_found;     // distinct, first-occurrence order
    std::vector<FindingSummary> findings;
    RiskLevel risk_level = RiskLevel::NONE;
};

struct OutputScanResult : ScanResult {
    std::string sanitized_text;
    size_t redaction_count = 0;
    RedactionMode redaction_mode = RedactionMode::MASK;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::NONE: return "none";
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
        case RiskLevel::CRITICAL: return "critical";
        default: return "unknown";
    }
}

inline const char* redaction_mode_to_string(RedactionMode mode) {
    switch (mode) {
        case RedactionMode::MASK: return "mask";
        case RedactionMode::REMOVE: return "remove";
        case RedactionMode::TOKENIZE: return "tokenize";
        default: return "unknown";
    }
}

inline Result<RedactionMode> parse_redaction_mode(std::string_view name) {
    if (name == "mask") return Result<RedactionMode>::ok(RedactionMode::MASK);
    if (name == "remove") return Result<RedactionMode>::ok(RedactionMode::REMOVE);
    if (name == "tokenize") return Result<RedactionMode>::ok(RedactionMode::TOKENIZE);
    return Result<RedactionMode>::error(ErrorCategory::INVALID_ARGUMENT,
        "Unsupported redaction mode '" + std::string(name) +
        "' (expected mask, remove or tokenize)");
}

} // namespace llmdlp
