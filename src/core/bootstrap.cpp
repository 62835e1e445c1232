#include "bootstrap.h"
#include "log_manager.h"
#include "config/config_store.h"

Bootstrap::Bootstrap(QObject* parent)
    : QObject(parent)
{
}

bool Bootstrap::start() {
    LOG_INFO(QStringLiteral("========== starting medguard =========="));

    const SafetyConfig config = m_config ? m_config->safetyConfig() : SafetyConfig();
    if (!config.isValid()) {
        emit stepProgress("config", false, "configuration is invalid");
        return false;
    }

    // [1/3] logging
    LogManager::instance().setMinimumLevel(config.runtime.debugMode ? LogManager::Debug : LogManager::Info);
    if (!config.runtime.logDir.isEmpty())
        LogManager::instance().initialize(config.runtime.logDir);
    emit stepProgress("logging", true, "logging ready");

    // [2/3] patterns
    auto registry = PatternRegistry::build(m_table);
    if (!registry) {
        LOG_ERROR(QStringLiteral("pattern registry build failed: [%1] %2")
                      .arg(registry.error().code, registry.error().message));
        emit stepProgress("patterns", false, registry.error().message);
        return false;
    }
    m_registry = *registry;
    LOG_INFO(QStringLiteral("[2/3] pattern registry ready: %1 keyword, %2 claim, %3 attribution, %4 injection patterns")
                 .arg(m_registry->diagnostic().size() + m_registry->prescriptive().size() + m_registry->alarm().size())
                 .arg(m_registry->ungrounded().size())
                 .arg(m_registry->grounded().size())
                 .arg(m_registry->injection().size()));
    emit stepProgress("patterns", true, "pattern registry ready");

    // [3/3] filter
    FilterOptions filterOptions;
    filterOptions.maxRephraseViolations = config.filter.maxRephraseViolations;
    SanitizerOptions sanitizerOptions;
    sanitizerOptions.maxLength = config.input.maxLength;
    sanitizerOptions.redactionMarker = config.input.redactionMarker;
    m_filter = std::make_unique<FilterOrchestrator>(m_registry, filterOptions, sanitizerOptions);
    LOG_INFO(QStringLiteral("[3/3] filter ready (max rephrase violations %1, max regenerations %2)")
                 .arg(config.filter.maxRephraseViolations)
                 .arg(config.filter.maxBoundaryRegenerations));
    emit stepProgress("filter", true, "filter ready");
    return true;
}

void Bootstrap::stop() {
    if (!m_filter)
        return;
    const AuditCounts counts = m_filter->telemetry()->snapshot();
    LOG_INFO(QStringLiteral("stopping medguard after %1 filtered response(s)").arg(counts.total));
    m_filter.reset();
    m_registry.reset();
}

int Bootstrap::maxBoundaryRegenerations() const {
    return m_config ? m_config->safetyConfig().filter.maxBoundaryRegenerations
                    : FilterSettings().maxBoundaryRegenerations;
}

bool Bootstrap::appendTruncationDisclaimer() const {
    return m_config ? m_config->safetyConfig().filter.appendTruncationDisclaimer
                    : FilterSettings().appendTruncationDisclaimer;
}
