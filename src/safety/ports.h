#pragma once
#include "candidate.h"
#include "failure.h"
#include <expected>
#include <QString>

template<typename T>
using Result = std::expected<T, SafetyFailure>;

using VoidResult = std::expected<void, SafetyFailure>;

struct GenerationRequest {
    QString wrappedQuery;   // sanitized query inside the prompt delimiters
    int attempt = 0;        // 0 = first generation, >0 = regeneration
};

struct GeneratedOutput {
    QString rawText;        // may start with a BOUNDARY_CHECK line
    QList<Citation> citations;
    double confidence = 0.0;
    QueryIntent intent = QueryIntent::General;
};

// Upstream generation collaborator (retrieval + model call).
class ICandidateGenerator {
public:
    virtual ~ICandidateGenerator() = default;
    virtual Result<GeneratedOutput> generate(const GenerationRequest& request) = 0;
};
