#pragma once

#include "core/types.hpp"

namespace llmdlp {

/**
 * @brief Maps a finding set to a RiskLevel
 *
 * Threshold table, first match wins:
 *   no findings       -> NONE
 *   >= 2 high tier    -> CRITICAL
 *   >= 1 high tier    -> HIGH
 *   >= 3 medium tier  -> HIGH
 *   >= 1 medium tier  -> MEDIUM
 *   otherwise         -> LOW
 *
 * Depends only on the multiset of categories, never on order or offsets.
 */
class RiskClassifier {
public:
    [[nodiscard]] static RiskLevel classify(const FindingSet& findings);
};

} // namespace llmdlp
