#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace llmdlp {

/**
 * @brief Redaction engine - rewrites text, replacing finding spans
 *
 * Strategies:
 * - MASK:     "[REDACTED_<CATEGORY>]"
 * - REMOVE:   empty string
 * - TOKENIZE: "[TOKEN_<CATEGORY>_<digits>]", digits = XXH64(raw, seed 0)
 *             mod 10^8, zero-padded to 8 (stable across processes and
 *             implementations)
 *
 * Findings are spliced in descending start order so earlier spans keep
 * their original offsets until their turn. Overlapping spans therefore
 * splice against already-rewritten text; offsets are clamped to the
 * current length and the result is deterministic but may nest markers.
 */
class Redactor {
public:
    /**
     * @brief Redact every finding from text
     */
    [[nodiscard]] static std::string redact(
        std::string_view text,
        const FindingSet& findings,
        RedactionMode mode);

    /**
     * @brief Replacement string for a single finding
     */
    [[nodiscard]] static std::string replacement_for(
        const Finding& finding,
        RedactionMode mode);

    /**
     * @brief Stable 64-bit digest of a raw value (XXH64, seed 0)
     */
    [[nodiscard]] static uint64_t token_digest(std::string_view raw);
};

} // namespace llmdlp
