#include "core/redactor.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <algorithm>
#include <format>
#include <numeric>
#include <vector>

namespace llmdlp {

static constexpr uint64_t kTokenModulus = 100000000ULL;   // 8 decimal digits

uint64_t Redactor::token_digest(std::string_view raw) {
    return XXH64(raw.data(), raw.size(), 0);
}

std::string Redactor::replacement_for(const Finding& finding, RedactionMode mode) {
    switch (mode) {
        case RedactionMode::MASK:
            return std::format("[REDACTED_{}]", finding.category.marker_name());

        case RedactionMode::REMOVE:
            return {};

        case RedactionMode::TOKENIZE:
            return std::format("[TOKEN_{}_{:08d}]", finding.category.marker_name(),
                               token_digest(finding.raw_text) % kTokenModulus);
    }
    return std::format("[REDACTED_{}]", finding.category.marker_name());
}

std::string Redactor::redact(
    std::string_view text,
    const FindingSet& findings,
    RedactionMode mode) {

    std::string sanitized(text);
    if (findings.empty()) {
        return sanitized;
    }

    // Order by start (stable, so equal starts keep set order), then walk it
    // backwards: strictly the reverse of the finding-set order.
    std::vector<size_t> order(findings.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&findings](size_t a, size_t b) {
        return findings[a].start < findings[b].start;
    });

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const Finding& finding = findings[*it];
        const size_t start = std::min(finding.start, sanitized.size());
        const size_t end = std::clamp(finding.end, start, sanitized.size());
        sanitized.replace(start, end - start, replacement_for(finding, mode));
    }

    return sanitized;
}

} // namespace llmdlp
