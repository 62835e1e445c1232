#include "audit_telemetry.h"
#include "core/log_manager.h"
#include <QMutexLocker>
#include <QStringList>

namespace {

template<typename K>
QString joinCounts(const QMap<K, int>& counts, QString (*name)(K)) {
    QStringList parts;
    for (auto it = counts.cbegin(); it != counts.cend(); ++it)
        parts << QStringLiteral("%1:%2").arg(name(it.key())).arg(it.value());
    return parts.isEmpty() ? QStringLiteral("-") : parts.join(QLatin1Char(','));
}

template<typename K>
QJsonObject countsToJson(const QMap<K, int>& counts, QString (*name)(K)) {
    QJsonObject obj;
    for (auto it = counts.cbegin(); it != counts.cend(); ++it)
        obj[name(it.key())] = it.value();
    return obj;
}

}

QJsonObject AuditCounts::toJson() const {
    QJsonObject root;
    root["total"] = total;
    root["outcomes"] = countsToJson<OutcomeKind>(outcomes, &Names::outcome);
    root["categories"] = countsToJson<ViolationCategory>(categories, &Names::category);
    root["layers"] = countsToJson<FilterLayer>(layers, &Names::layer);
    return root;
}

QString AuditTelemetry::describe(const FilteredResponse& response) {
    QMap<ViolationCategory, int> categories;
    QMap<FilterLayer, int> layers;
    const auto violations = outcomeViolations(response.outcome);
    for (const auto& v : violations) {
        ++categories[v.category];
        ++layers[v.layer];
    }
    return QStringLiteral("outcome=%1 violations=%2 categories=%3 layers=%4")
        .arg(Names::outcome(response.kind()))
        .arg(violations.size())
        .arg(joinCounts<ViolationCategory>(categories, &Names::category),
             joinCounts<FilterLayer>(layers, &Names::layer));
}

void AuditTelemetry::record(const FilteredResponse& response) {
    {
        QMutexLocker lock(&m_mutex);
        ++m_counts.total;
        ++m_counts.outcomes[response.kind()];
        for (const auto& v : outcomeViolations(response.outcome)) {
            ++m_counts.categories[v.category];
            ++m_counts.layers[v.layer];
        }
    }

    const auto level = response.kind() == OutcomeKind::Blocked
        ? LogManager::Warning : LogManager::Info;
    LOG_CATEGORY(level, "safety", describe(response));
}

AuditCounts AuditTelemetry::snapshot() const {
    QMutexLocker lock(&m_mutex);
    return m_counts;
}

void AuditTelemetry::reset() {
    QMutexLocker lock(&m_mutex);
    m_counts = {};
}
