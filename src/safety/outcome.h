#pragma once
#include "candidate.h"
#include "violation.h"
#include <variant>

struct FilterPassed {};

struct FilterRephrased {
    ViolationList fixedViolations;
};

struct FilterBlocked {
    ViolationList violations;
    QString fallbackMessage;
};

using FilterOutcome = std::variant<FilterPassed, FilterRephrased, FilterBlocked>;

inline OutcomeKind outcomeKind(const FilterOutcome& outcome) {
    if (std::holds_alternative<FilterPassed>(outcome))
        return OutcomeKind::Passed;
    if (std::holds_alternative<FilterRephrased>(outcome))
        return OutcomeKind::Rephrased;
    return OutcomeKind::Blocked;
}

// Violations carried by the outcome: fixed ones for Rephrased, remaining
// ones for Blocked, none for Passed.
inline ViolationList outcomeViolations(const FilterOutcome& outcome) {
    if (const auto* r = std::get_if<FilterRephrased>(&outcome))
        return r->fixedViolations;
    if (const auto* b = std::get_if<FilterBlocked>(&outcome))
        return b->violations;
    return {};
}

struct FilteredResponse {
    // Original text (Passed), rewritten text (Rephrased) or the fallback
    // message (Blocked). Never the unsafe text.
    QString text;
    QList<Citation> citations;
    double confidence = 0.0;
    QueryIntent intent = QueryIntent::General;
    BoundaryTag boundary = BoundaryTag::OutOfBounds;
    FilterOutcome outcome = FilterBlocked{};

    OutcomeKind kind() const { return outcomeKind(outcome); }
    bool isReleasable() const { return kind() != OutcomeKind::Blocked; }
    bool needsRegeneration() const {
        const auto* b = std::get_if<FilterBlocked>(&outcome);
        return b && hasCategory(b->violations, ViolationCategory::BoundaryViolation);
    }
};

namespace Names {
    QString outcome(OutcomeKind kind);
}
