#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "report/report_builder.hpp"
#include "scanner/dlp_scanner.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace llmdlp;

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFindings = 1;
constexpr int kExitError = 2;

struct CliOptions {
    std::string config_file;
    std::optional<std::string> mode;
    bool json = false;
    bool report = false;
    std::vector<std::pair<std::string, std::string>> patterns;   // NAME=REGEX
    std::string command;                                          // input | output
    std::string input_file;                                       // empty = stdin
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--mode mask|remove|tokenize] [--json] [--report]\n"
        "       {:{}} [--pattern NAME=REGEX]... (input|output) [FILE]\n"
        "\n"
        "  input    scan a prompt; prints the findings\n"
        "  output   scan a completion; prints the sanitized text\n"
        "\n"
        "Exit status: 0 no findings, 1 findings, 2 error\n",
        argv0, "", std::string_view(argv0).size());
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            opts.config_file = argv[++i];
        } else if (arg == "--mode" && has_value) {
            opts.mode = argv[++i];
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--report") {
            opts.report = true;
        } else if (arg == "--pattern" && has_value) {
            const std::string spec = argv[++i];
            const size_t eq = spec.find('=');
            if (eq == std::string::npos || eq == 0) {
                utils::log::error(std::format("--pattern expects NAME=REGEX, got '{}'", spec));
                return std::nullopt;
            }
            opts.patterns.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (opts.command.empty() && (arg == "input" || arg == "output")) {
            opts.command = arg;
        } else if (!opts.command.empty() && opts.input_file.empty() && !arg.starts_with("--")) {
            opts.input_file = arg;
        } else {
            utils::log::error(std::format("Unexpected argument '{}'", arg));
            return std::nullopt;
        }
    }
    if (opts.command.empty()) {
        return std::nullopt;
    }
    return opts;
}

std::optional<std::string> read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return kExitError;
    }

    try {
        DlpConfig config;
        if (!opts->config_file.empty()) {
            auto loaded = ConfigLoader::load_from_file(opts->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitError;
            }
            config = std::move(loaded.config);
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        DlpScanner scanner(config);
        if (opts->mode) {
            scanner.set_redaction_mode(*opts->mode);
        }
        for (const auto& [name, pattern] : opts->patterns) {
            scanner.register_category(name, pattern, 0.8);
        }

        const auto text = read_input(opts->input_file);
        if (!text) {
            utils::log::error(std::format("Cannot read input file '{}'", opts->input_file));
            return kExitError;
        }

        if (opts->command == "input") {
            const auto result = scanner.scan_input(*text);
            if (opts->json) {
                std::cout << ReportBuilder::to_json(result).dump(2) << '\n';
            } else if (opts->report) {
                std::cout << DlpScanner::render_report(result);
            } else {
                for (const auto& f : result.findings) {
                    std::cout << std::format("{}\t{}\t{}\t{:.2f}\n",
                        f.category.name(), f.start, f.end, f.confidence);
                }
                std::cout << std::format("risk_level\t{}\n", risk_level_to_string(result.risk_level));
            }
            if (result.has_findings) {
                utils::log::warn(std::format("Sensitive data in prompt: {} finding(s), risk {}",
                    result.finding_count, risk_level_to_string(result.risk_level)));
            }
            return result.has_findings ? kExitFindings : kExitClean;
        }

        const auto result = scanner.scan_output(*text);
        if (opts->json) {
            std::cout << ReportBuilder::to_json(result).dump(2) << '\n';
        } else if (opts->report) {
            std::cout << DlpScanner::render_report(result);
        } else {
            std::cout << result.sanitized_text;
        }
        if (result.has_findings) {
            utils::log::warn(std::format("Redacted {} finding(s) from completion, risk {}",
                result.redaction_count, risk_level_to_string(result.risk_level)));
        }
        return result.has_findings ? kExitFindings : kExitClean;

    } catch (const DlpError& e) {
        utils::log::error(e.what());
        return kExitError;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Unexpected error: {}", e.what()));
        return kExitError;
    }
}
