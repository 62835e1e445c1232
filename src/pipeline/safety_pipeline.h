#pragma once
#include "regeneration_policy.h"
#include "safety/filter_orchestrator.h"
#include "safety/ports.h"

struct PipelineOptions {
    bool appendTruncationDisclaimer = true;
};

// Request path around the filter: sanitize, wrap, generate, clean, parse
// the boundary tag, filter, and regenerate on boundary failure.
class SafetyPipeline {
public:
    SafetyPipeline(const FilterOrchestrator* filter,
                   ICandidateGenerator* generator,
                   RegenerationPolicy policy = RegenerationPolicy(),
                   PipelineOptions options = {});

    Result<FilteredResponse> answer(const QString& rawQuery);

    // Turns one raw generator output into a candidate. Exposed for the CLI.
    CandidateResponse toCandidate(const GeneratedOutput& output) const;

private:
    const FilterOrchestrator* m_filter;
    ICandidateGenerator* m_generator;
    RegenerationPolicy m_policy;
    PipelineOptions m_options;
};
