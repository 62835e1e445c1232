#include "safety_pipeline.h"
#include "safety/boundary_validator.h"
#include "safety/output_sanitizer.h"
#include "core/log_manager.h"

SafetyPipeline::SafetyPipeline(const FilterOrchestrator* filter,
                               ICandidateGenerator* generator,
                               RegenerationPolicy policy,
                               PipelineOptions options)
    : m_filter(filter)
    , m_generator(generator)
    , m_policy(policy)
    , m_options(options)
{
}

CandidateResponse SafetyPipeline::toCandidate(const GeneratedOutput& output) const {
    const TaggedOutput tagged = BoundaryValidator::parseTaggedOutput(
        OutputSanitizer::clean(output.rawText));

    CandidateResponse c;
    c.text = tagged.body;
    c.boundary = tagged.tag;
    c.citations = output.citations;
    c.confidence = output.confidence;
    c.intent = output.intent;

    // The disclaimer goes in before filtering so it is scanned too.
    if (m_options.appendTruncationDisclaimer && OutputSanitizer::isLikelyTruncated(c.text))
        c.text = OutputSanitizer::appendDisclaimer(c.text);
    return c;
}

Result<FilteredResponse> SafetyPipeline::answer(const QString& rawQuery) {
    if (!m_filter || !m_generator)
        return std::unexpected(SafetyFailure::unavailable(
            QStringLiteral("safety pipeline is not wired")));

    auto sanitized = m_filter->sanitizeInput(rawQuery);
    if (!sanitized) return std::unexpected(sanitized.error());

    GenerationRequest request;
    request.wrappedQuery = InputSanitizer::wrapForPrompt(sanitized->text);

    const RegenerationPlan plan = m_policy.plan();
    for (int attempt = 0; ; ++attempt) {
        request.attempt = attempt;
        auto generated = m_generator->generate(request);
        if (!generated) return std::unexpected(generated.error());

        FilteredResponse response = m_filter->filter(toCandidate(*generated));
        const RetryDecision decision = m_policy.nextRetry(plan, attempt, response);
        if (!decision.retry) {
            if (response.needsRegeneration())
                LOG_CATEGORY(LogManager::Warning, "safety", decision.reason);
            return response;
        }
        LOG_CATEGORY(LogManager::Info, "safety", decision.reason);
    }
}
