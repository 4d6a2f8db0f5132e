#pragma once

#include "detector/category_validators.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace llmdlp {

// ============================================================================
// Configuration Types
// ============================================================================

struct ScannerConfig {
    std::string redaction_mode = "mask";        // parsed at use site
    size_t max_input_bytes = 1024 * 1024;       // 1 MiB
    bool parallel_categories = true;
    size_t parallel_threshold_bytes = 4096;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Organization-specific detection rule from [[categories]]
 */
struct CategoryConfig {
    std::string name;
    std::string pattern;
    double confidence = 0.8;
    std::string description;
    std::string validator;                      // empty = category default
};

/**
 * @brief Complete parsed configuration
 */
struct DlpConfig {
    ScannerConfig scanner;
    ValidatorConfig validators;
    LoggingConfig logging;
    std::vector<CategoryConfig> categories;
};

} // namespace llmdlp
