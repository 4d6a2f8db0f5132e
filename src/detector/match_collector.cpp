#include "detector/match_collector.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <thread>

namespace llmdlp {

std::vector<Finding> MatchCollector::scan_rule(
    const DetectionRule& rule, std::string_view text) const {

    std::vector<Finding> findings;
    const re2::RE2& re = *rule.matcher;
    const re2::StringPiece input(text.data(), text.size());

    size_t pos = 0;
    re2::StringPiece match;
    while (pos <= input.size() &&
           re.Match(input, pos, input.size(), re2::RE2::UNANCHORED, &match, 1)) {

        const size_t start = static_cast<size_t>(match.data() - input.data());
        const size_t end = start + match.size();

        // Zero-length matches are never findings; step past them so the
        // scan always makes progress.
        if (match.empty()) {
            pos = end + 1;
            continue;
        }

        const std::string_view raw(text.data() + start, match.size());
        if (validators_.validate(rule.validator, raw)) {
            findings.emplace_back(rule.category, std::string(raw), start, end,
                                  rule.base_confidence);
        }
        pos = end;
    }

    return findings;
}

FindingSet MatchCollector::find_all(std::string_view text) const {
    const auto& rules = registry_.rules();
    std::vector<std::vector<Finding>> per_rule(rules.size());

    const unsigned hw_threads = std::thread::hardware_concurrency();
    const bool go_parallel = options_.parallel
        && rules.size() > 1
        && hw_threads > 1
        && text.size() >= options_.parallel_threshold_bytes;

    if (go_parallel) {
        std::vector<std::future<std::vector<Finding>>> futures;
        futures.reserve(rules.size());
        for (const auto& rule : rules) {
            futures.push_back(std::async(std::launch::async,
                [this, &rule, text] { return scan_rule(rule, text); }));
        }
        // Collect in registration order; get() rethrows any task failure
        for (size_t i = 0; i < futures.size(); ++i) {
            per_rule[i] = futures[i].get();
        }
    } else {
        for (size_t i = 0; i < rules.size(); ++i) {
            per_rule[i] = scan_rule(rules[i], text);
        }
    }

    FindingSet merged;
    size_t total = 0;
    for (const auto& findings : per_rule) total += findings.size();
    merged.reserve(total);
    for (auto& findings : per_rule) {
        std::move(findings.begin(), findings.end(), std::back_inserter(merged));
    }

    std::stable_sort(merged.begin(), merged.end(),
        [](const Finding& a, const Finding& b) { return a.start < b.start; });

    return merged;
}

} // namespace llmdlp
