#include "detector/risk_classifier.hpp"

namespace llmdlp {

RiskLevel RiskClassifier::classify(const FindingSet& findings) {
    if (findings.empty()) {
        return RiskLevel::NONE;
    }

    size_t high_count = 0;
    size_t medium_count = 0;
    for (const auto& finding : findings) {
        switch (finding.category.tier()) {
            case SeverityTier::HIGH:   ++high_count; break;
            case SeverityTier::MEDIUM: ++medium_count; break;
            case SeverityTier::LOW:    break;
        }
    }

    if (high_count >= 2) return RiskLevel::CRITICAL;
    if (high_count >= 1) return RiskLevel::HIGH;
    if (medium_count >= 3) return RiskLevel::HIGH;
    if (medium_count >= 1) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

} // namespace llmdlp
