#include "filter_orchestrator.h"
#include "validate.h"
#include "core/log_manager.h"
#include <QStringList>
#include <algorithm>

namespace {

FilteredResponse passThrough(const CandidateResponse& c) {
    FilteredResponse r;
    r.text = c.text;
    r.citations = c.citations;
    r.confidence = c.confidence;
    r.intent = c.intent;
    r.boundary = c.boundary;
    return r;
}

FilteredResponse blocked(const CandidateResponse& c, ViolationList violations, const QString& fallback) {
    FilteredResponse r = passThrough(c);
    r.text = fallback;
    r.outcome = FilterBlocked{std::move(violations), fallback};
    return r;
}

}

FilterOrchestrator::FilterOrchestrator(RegistryPtr registry,
                                       FilterOptions options,
                                       SanitizerOptions sanitizerOptions,
                                       std::shared_ptr<AuditTelemetry> telemetry)
    : m_registry(registry)
    , m_options(options)
    , m_keywords(registry)
    , m_grounding(registry)
    , m_rephrase(registry)
    , m_sanitizer(registry, std::move(sanitizerOptions))
    , m_telemetry(telemetry ? std::move(telemetry) : std::make_shared<AuditTelemetry>())
{
    m_options.maxRephraseViolations = qMax(0, m_options.maxRephraseViolations);
}

ViolationList FilterOrchestrator::scanContent(const QString& text) const {
    ViolationList all = m_keywords.scan(text);
    all += m_grounding.check(text);
    std::stable_sort(all.begin(), all.end(), [](const Violation& a, const Violation& b) {
        return a.offset < b.offset;
    });
    return all;
}

FilteredResponse FilterOrchestrator::filter(const CandidateResponse& candidate) const {
    FilteredResponse result = decide(candidate);
    m_telemetry->record(result);
    return result;
}

FilteredResponse FilterOrchestrator::blockMalformed(const SafetyFailure& failure) const {
    LOG_CATEGORY(LogManager::Warning, "safety",
                 QStringLiteral("malformed candidate: %1").arg(failure.code));
    FilteredResponse result = blocked(CandidateResponse{}, {}, RephraseEngine::genericFallback());
    m_telemetry->record(result);
    return result;
}

FilteredResponse FilterOrchestrator::decide(const CandidateResponse& candidate) const {
    if (!m_registry) {
        LOG_CATEGORY(LogManager::Error, "safety", QStringLiteral("filter called without a pattern registry"));
        return blocked(candidate, {}, RephraseEngine::genericFallback());
    }
    if (auto valid = Validate::candidate(candidate); !valid) {
        LOG_CATEGORY(LogManager::Warning, "safety",
                     QStringLiteral("malformed candidate: %1").arg(valid.error().code));
        return blocked(candidate, {}, RephraseEngine::genericFallback());
    }

    // Layer 1
    const ViolationList boundary = m_boundary.check(candidate);
    if (!boundary.isEmpty()) {
        FilteredResponse r = blocked(candidate, boundary, RephraseEngine::boundaryFallback());
        r.boundary = BoundaryTag::OutOfBounds;
        return r;
    }

    // Layers 2 + 3
    const ViolationList violations = scanContent(candidate.text);
    if (violations.isEmpty()) {
        FilteredResponse r = passThrough(candidate);
        r.outcome = FilterPassed{};
        return r;
    }

    if (violations.size() > m_options.maxRephraseViolations)
        return blocked(candidate, violations, RephraseEngine::selectFallback(violations));

    const auto rewritten = m_rephrase.rephrase(candidate.text, violations);
    if (!rewritten)
        return blocked(candidate, violations, RephraseEngine::selectFallback(violations));

    const ViolationList remaining = scanContent(*rewritten);
    if (!remaining.isEmpty())
        return blocked(candidate, remaining, RephraseEngine::selectFallback(violations));

    FilteredResponse r = passThrough(candidate);
    r.text = *rewritten;
    r.outcome = FilterRephrased{violations};
    return r;
}

Result<SanitizedInput> FilterOrchestrator::sanitizeInput(const QString& raw) const {
    if (auto valid = Validate::query(raw); !valid)
        return std::unexpected(valid.error());
    auto sanitized = m_sanitizer.sanitize(raw);
    if (sanitized && sanitized->wasModified) {
        QStringList kinds;
        for (const auto& m : sanitized->modifications)
            kinds << Names::modification(m.kind);
        LOG_CATEGORY(LogManager::Info, "safety",
                     QStringLiteral("input sanitized: %1").arg(kinds.join(QLatin1Char(','))));
    }
    return sanitized;
}
