#pragma once
#include "safety/boundary_validator.h"
#include "safety/outcome.h"

struct RegenerationPlan {
    int maxAttempts = 1;    // first generation included
};

struct RetryDecision {
    bool retry = false;
    QString reason;
};

// Only boundary-blocked responses are regenerated; content violations are
// the filter's job.
class RegenerationPolicy {
public:
    explicit RegenerationPolicy(int maxBoundaryRegenerations = BoundaryValidator::kDefaultMaxRegenerations)
        : m_maxRegenerations(qMax(0, maxBoundaryRegenerations)) {}

    RegenerationPlan plan() const;
    RetryDecision nextRetry(const RegenerationPlan& plan,
                            int attempt,
                            const FilteredResponse& response) const;

private:
    int m_maxRegenerations;
};
