#include "candidate.h"
#include "violation.h"
#include "outcome.h"

namespace Names {

QString boundary(BoundaryTag tag) {
    switch (tag) {
    case BoundaryTag::Understanding: return QStringLiteral("understanding");
    case BoundaryTag::Awareness:     return QStringLiteral("awareness");
    case BoundaryTag::Preparation:   return QStringLiteral("preparation");
    case BoundaryTag::OutOfBounds:   return QStringLiteral("out_of_bounds");
    }
    return QStringLiteral("out_of_bounds");
}

QString intent(QueryIntent intent) {
    switch (intent) {
    case QueryIntent::Factual:     return QStringLiteral("factual");
    case QueryIntent::Exploratory: return QStringLiteral("exploratory");
    case QueryIntent::Symptom:     return QStringLiteral("symptom");
    case QueryIntent::Timeline:    return QStringLiteral("timeline");
    case QueryIntent::General:     return QStringLiteral("general");
    }
    return QStringLiteral("general");
}

BoundaryTag boundaryFromString(const QString& value) {
    const QString v = value.trimmed().toLower();
    if (v == QStringLiteral("understanding")) return BoundaryTag::Understanding;
    if (v == QStringLiteral("awareness"))     return BoundaryTag::Awareness;
    if (v == QStringLiteral("preparation"))   return BoundaryTag::Preparation;
    return BoundaryTag::OutOfBounds;
}

QueryIntent intentFromString(const QString& value) {
    const QString v = value.trimmed().toLower();
    if (v == QStringLiteral("factual"))     return QueryIntent::Factual;
    if (v == QStringLiteral("exploratory")) return QueryIntent::Exploratory;
    if (v == QStringLiteral("symptom"))     return QueryIntent::Symptom;
    if (v == QStringLiteral("timeline"))    return QueryIntent::Timeline;
    return QueryIntent::General;
}

QString layer(FilterLayer layer) {
    switch (layer) {
    case FilterLayer::BoundaryCheck:      return QStringLiteral("boundary_check");
    case FilterLayer::KeywordScan:        return QStringLiteral("keyword_scan");
    case FilterLayer::ReportingVsStating: return QStringLiteral("reporting_vs_stating");
    }
    return QStringLiteral("unknown");
}

QString category(ViolationCategory category) {
    switch (category) {
    case ViolationCategory::BoundaryViolation:    return QStringLiteral("boundary_violation");
    case ViolationCategory::DiagnosticLanguage:   return QStringLiteral("diagnostic_language");
    case ViolationCategory::PrescriptiveLanguage: return QStringLiteral("prescriptive_language");
    case ViolationCategory::AlarmLanguage:        return QStringLiteral("alarm_language");
    case ViolationCategory::UngroundedClaim:      return QStringLiteral("ungrounded_claim");
    }
    return QStringLiteral("unknown");
}

QString outcome(OutcomeKind kind) {
    switch (kind) {
    case OutcomeKind::Passed:    return QStringLiteral("passed");
    case OutcomeKind::Rephrased: return QStringLiteral("rephrased");
    case OutcomeKind::Blocked:   return QStringLiteral("blocked");
    }
    return QStringLiteral("blocked");
}

}

bool hasCategory(const ViolationList& violations, ViolationCategory category) {
    for (const auto& v : violations) {
        if (v.category == category)
            return true;
    }
    return false;
}
