#pragma once
#include "pattern_registry.h"
#include "violation.h"

// Layer 2. Diagnostic, prescriptive and alarm language.
class KeywordScanner {
public:
    explicit KeywordScanner(RegistryPtr registry) : m_registry(std::move(registry)) {}

    ViolationList scan(const QString& text) const;

    // Sorts by (offset asc, length desc) and drops every match fully
    // contained in an earlier kept match.
    static void deduplicate(ViolationList& violations);

private:
    RegistryPtr m_registry;
};
