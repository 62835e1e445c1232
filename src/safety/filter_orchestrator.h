#pragma once
#include "audit_telemetry.h"
#include "boundary_validator.h"
#include "grounding_checker.h"
#include "input_sanitizer.h"
#include "keyword_scanner.h"
#include "outcome.h"
#include "rephrase_engine.h"
#include <memory>

struct FilterOptions {
    int maxRephraseViolations = 3;
};

// Sequences the three layers and the rewrite-then-reverify step. filter()
// never fails: anything it cannot prove safe is Blocked.
class FilterOrchestrator {
public:
    FilterOrchestrator(RegistryPtr registry,
                       FilterOptions options = {},
                       SanitizerOptions sanitizerOptions = {},
                       std::shared_ptr<AuditTelemetry> telemetry = nullptr);

    FilteredResponse filter(const CandidateResponse& candidate) const;
    Result<SanitizedInput> sanitizeInput(const QString& raw) const;

    // Blocked response for input that could not be decoded into a candidate.
    // Counted by telemetry like any other outcome.
    FilteredResponse blockMalformed(const SafetyFailure& failure) const;

    // Layers 2 and 3 merged, ordered by offset.
    ViolationList scanContent(const QString& text) const;

    const FilterOptions& options() const { return m_options; }
    std::shared_ptr<AuditTelemetry> telemetry() const { return m_telemetry; }

private:
    FilteredResponse decide(const CandidateResponse& candidate) const;

    RegistryPtr m_registry;
    FilterOptions m_options;
    BoundaryValidator m_boundary;
    KeywordScanner m_keywords;
    GroundingChecker m_grounding;
    RephraseEngine m_rephrase;
    InputSanitizer m_sanitizer;
    std::shared_ptr<AuditTelemetry> m_telemetry;
};
