#include "regeneration_policy.h"

RegenerationPlan RegenerationPolicy::plan() const {
    return {1 + m_maxRegenerations};
}

RetryDecision RegenerationPolicy::nextRetry(const RegenerationPlan& plan,
                                            int attempt,
                                            const FilteredResponse& response) const {
    if (!response.needsRegeneration()) {
        return {false, QStringLiteral("no boundary violation")};
    }

    const int maxAttempts = qMax(1, plan.maxAttempts);
    if (attempt + 1 >= maxAttempts) {
        return {false, QStringLiteral("max regeneration attempts reached")};
    }

    return {
        true,
        QStringLiteral("regeneration %1/%2: response out of bounds")
            .arg(attempt + 1)
            .arg(maxAttempts - 1)
    };
}
