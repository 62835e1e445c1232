#pragma once
#include "pattern_registry.h"
#include "violation.h"

struct Sentence {
    QString text;
    qsizetype offset = 0;   // first non-whitespace character in the source
};

// Layer 3. A claim about the patient must be attributed to a document, a
// professional or a dated record in the same sentence.
class GroundingChecker {
public:
    explicit GroundingChecker(RegistryPtr registry) : m_registry(std::move(registry)) {}

    ViolationList check(const QString& text) const;

    static QList<Sentence> splitSentences(const QString& text);

private:
    bool isGrounded(const QString& sentence) const;

    RegistryPtr m_registry;
};
