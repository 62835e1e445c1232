#pragma once
#include "safety/filter_orchestrator.h"
#include "safety/pattern_registry.h"
#include <QObject>
#include <memory>

class ConfigStore;

// Startup: logging, registry (fatal on failure), component wiring. Holds the
// filter for the lifetime of the process.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(QObject* parent = nullptr);

    void setConfig(ConfigStore* config) { m_config = config; }
    void setPatternTable(const PatternTable& table) { m_table = table; }

    bool start();
    void stop();
    bool isReady() const { return m_filter != nullptr; }

    RegistryPtr registry() const { return m_registry; }
    const FilterOrchestrator* filter() const { return m_filter.get(); }
    int maxBoundaryRegenerations() const;
    bool appendTruncationDisclaimer() const;

signals:
    void stepProgress(const QString& step, bool success, const QString& message);

private:
    ConfigStore* m_config = nullptr;
    PatternTable m_table = PatternTable::defaults();
    RegistryPtr m_registry;
    std::unique_ptr<FilterOrchestrator> m_filter;
};
