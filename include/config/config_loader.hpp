#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace llmdlp {

/**
 * @brief Loads DlpConfig from TOML
 *
 * String values may reference environment variables as ${NAME}. A top-level
 * `include = "file.toml"` (or an array of files) is resolved relative to the
 * including file; the including file wins on scalar conflicts and arrays
 * such as [[categories]] are concatenated.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        DlpConfig config;

        static LoadResult ok(DlpConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to llm-dlp.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes are not resolved)
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a config for semantic errors
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const DlpConfig& config);

private:
    static ScannerConfig extract_scanner(const toml::table& root);
    static ValidatorConfig extract_validators(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static std::vector<CategoryConfig> extract_categories(const toml::table& root);

    static DlpConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(DlpConfig config);
};

} // namespace llmdlp
