#pragma once
#include "outcome.h"
#include <QJsonObject>
#include <QMap>
#include <QMutex>

struct AuditCounts {
    int total = 0;
    QMap<OutcomeKind, int> outcomes;
    QMap<ViolationCategory, int> categories;
    QMap<FilterLayer, int> layers;

    QJsonObject toJson() const;
};

// Content-free audit trail of filter outcomes. Records and logs outcome,
// category and layer counts; never the matched text.
class AuditTelemetry {
public:
    void record(const FilteredResponse& response);

    AuditCounts snapshot() const;
    void reset();

    // One log line for an outcome, e.g. "outcome=blocked violations=2
    // categories=alarm_language:2 layers=keyword_scan:2".
    static QString describe(const FilteredResponse& response);

private:
    mutable QMutex m_mutex;
    AuditCounts m_counts;
};
