#pragma once
#include "pattern_registry.h"
#include "violation.h"
#include <optional>

// Rule-based rewrite of violating spans. Either every violation is fixed or
// nothing is returned; there are no partial fixes.
class RephraseEngine {
public:
    explicit RephraseEngine(RegistryPtr registry) : m_registry(std::move(registry)) {}

    std::optional<QString> rephrase(const QString& text, const ViolationList& violations) const;

    // Alarm > prescriptive > diagnostic > generic.
    static QString selectFallback(const ViolationList& violations);
    static QString boundaryFallback();
    static QString genericFallback();

private:
    RegistryPtr m_registry;
};
