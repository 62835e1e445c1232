#pragma once
#include "pattern_registry.h"
#include <QList>
#include <QString>

struct InputModification {
    InputModificationKind kind = InputModificationKind::InvisibleUnicodeRemoved;
    QString description;    // counts only, never removed content
};

struct SanitizedInput {
    QString text;
    bool wasModified = false;
    QList<InputModification> modifications;
};

struct SanitizerOptions {
    qsizetype maxLength = 2000;
    QString redactionMarker = QStringLiteral("[FILTERED]");
};

class InputSanitizer {
public:
    explicit InputSanitizer(RegistryPtr registry, SanitizerOptions options = {})
        : m_registry(std::move(registry)), m_options(std::move(options)) {}

    // Steps run in a fixed order: invisible code points, control characters,
    // injection phrases, length.
    Result<SanitizedInput> sanitize(const QString& raw) const;

    static QString wrapForPrompt(const QString& text);
    static bool isInvisible(char32_t cp);

    const SanitizerOptions& options() const { return m_options; }

private:
    RegistryPtr m_registry;
    SanitizerOptions m_options;
};

namespace Names {
    QString modification(InputModificationKind kind);
}
