#include "config/config_loader.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace llmdlp {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_in_table(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_in_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge overlay into base. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* base_node = base.get(key.str());
        if (val.is_table() && base_node && base_node->is_table()) {
            merge_tables(*base_node->as_table(), *val.as_table());
        } else if (val.is_array() && base_node && base_node->is_array()) {
            auto& base_arr = *base_node->as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {} (possible circular include)", kMaxIncludeDepth));
    }
    const auto* inc_node = root.get("include");
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (const auto* s = inc_node->as_string()) {
        paths.emplace_back(s->get());
    } else if (const auto* arr = inc_node->as_array()) {
        for (const auto& item : *arr) {
            if (const auto* item_str = item.as_string()) {
                paths.emplace_back(item_str->get());
            }
        }
    } else {
        throw std::runtime_error("'include' must be a string or an array of strings");
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const fs::path abs_path = fs::canonical(base_dir / rel_path);

        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        auto included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_env_vars_in_table(result);
    return result;
}

// Negative integers clamp to 0 so validation reports them as out of range
size_t toml_size(const toml::table& tbl, std::string_view key, size_t fallback) {
    const auto value = tbl[key].value<int64_t>();
    if (!value) return fallback;
    return *value < 0 ? 0 : static_cast<size_t>(*value);
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ScannerConfig ConfigLoader::extract_scanner(const toml::table& root) {
    ScannerConfig cfg;
    const auto* scanner = root["scanner"].as_table();
    if (!scanner) return cfg;
    const auto& s = *scanner;

    cfg.redaction_mode = utils::to_lower(s["redaction_mode"].value_or(cfg.redaction_mode));
    cfg.max_input_bytes = toml_size(s, "max_input_bytes", cfg.max_input_bytes);
    cfg.parallel_categories = s["parallel_categories"].value_or(cfg.parallel_categories);
    cfg.parallel_threshold_bytes =
        toml_size(s, "parallel_threshold_bytes", cfg.parallel_threshold_bytes);
    return cfg;
}

ValidatorConfig ConfigLoader::extract_validators(const toml::table& root) {
    ValidatorConfig cfg;
    const auto* validators = root["validators"].as_table();
    if (!validators) return cfg;
    const auto& v = *validators;

    if (v["email_denylist"].is_array()) {
        cfg.email_denylist = toml_string_array(v, "email_denylist");
    }
    cfg.credential_min_length =
        toml_size(v, "credential_min_length", cfg.credential_min_length);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = utils::to_lower((*logging)["level"].value_or(cfg.level));
    }
    return cfg;
}

std::vector<CategoryConfig> ConfigLoader::extract_categories(const toml::table& root) {
    std::vector<CategoryConfig> categories;
    const auto* arr = root["categories"].as_array();
    if (!arr) return categories;

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& c = *tbl;

        CategoryConfig cat;
        cat.name = c["name"].value_or(""s);
        cat.pattern = c["pattern"].value_or(""s);
        cat.confidence = c["confidence"].value_or(cat.confidence);
        cat.description = c["description"].value_or(""s);
        cat.validator = c["validator"].value_or(""s);
        categories.push_back(std::move(cat));
    }
    return categories;
}

DlpConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    DlpConfig config;
    config.scanner = extract_scanner(tbl);
    config.validators = extract_validators(tbl);
    config.logging = extract_logging(tbl);
    config.categories = extract_categories(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(DlpConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DlpConfig& config) {
    std::vector<std::string> errors;

    if (const auto mode = parse_redaction_mode(config.scanner.redaction_mode); mode.is_error()) {
        errors.push_back(std::format("scanner.redaction_mode: {}", mode.error_message()));
    }
    if (config.scanner.max_input_bytes == 0) {
        errors.push_back("scanner.max_input_bytes must be > 0");
    }
    if (config.validators.credential_min_length == 0) {
        errors.push_back("validators.credential_min_length must be > 0");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    for (size_t i = 0; i < config.categories.size(); ++i) {
        const auto& cat = config.categories[i];
        if (cat.name.empty()) {
            errors.push_back(std::format("categories[{}].name must not be empty", i));
        }
        if (cat.pattern.empty()) {
            errors.push_back(std::format("categories[{}].pattern must not be empty", i));
        }
        if (std::isnan(cat.confidence) || cat.confidence < 0.0 || cat.confidence > 1.0) {
            errors.push_back(std::format(
                "categories[{}].confidence must be within [0, 1], got {}", i, cat.confidence));
        }
        if (!cat.validator.empty() && !parse_validator_kind(cat.validator)) {
            errors.push_back(std::format(
                "categories[{}].validator '{}' is not one of accept, luhn, ipv4, "
                "email_domain, credential", i, cat.validator));
        }
    }

    return errors;
}

} // namespace llmdlp
