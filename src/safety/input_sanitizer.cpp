#include "input_sanitizer.h"

namespace {

qsizetype truncationPoint(const QString& text, qsizetype max) {
    if (text.at(max).isSpace())
        return max;
    // A cut at index 0 would empty the query; leading whitespace falls
    // through to the hard cut below.
    for (qsizetype i = max - 1; i > 0; --i) {
        if (text.at(i).isSpace())
            return i;
    }
    // No whitespace to cut at; do not split a surrogate pair.
    if (max > 0 && text.at(max - 1).isHighSurrogate())
        return max - 1;
    return max;
}

}

bool InputSanitizer::isInvisible(char32_t cp) {
    return (cp >= 0x200B && cp <= 0x200F)
        || (cp >= 0x202A && cp <= 0x202E)
        || (cp >= 0x2060 && cp <= 0x2064)
        || (cp >= 0x2066 && cp <= 0x2069)
        || cp == 0xFEFF || cp == 0x00AD || cp == 0x034F
        || cp == 0x061C || cp == 0x180E;
}

Result<SanitizedInput> InputSanitizer::sanitize(const QString& raw) const {
    if (!m_registry) {
        return std::unexpected(SafetyFailure::unavailable(
            QStringLiteral("pattern registry not initialized")));
    }
    if (m_options.maxLength < 1) {
        return std::unexpected(SafetyFailure::invalidInput(
            QStringLiteral("invalid_max_length"),
            QStringLiteral("maxLength must be positive")));
    }

    SanitizedInput out;
    auto record = [&out](InputModificationKind kind, const QString& description) {
        out.wasModified = true;
        out.modifications.append({kind, description});
    };

    // 1. invisible / zero-width / bidi
    QString text;
    text.reserve(raw.size());
    int invisible = 0;
    for (qsizetype i = 0; i < raw.size(); ++i) {
        const QChar c = raw.at(i);
        if (isInvisible(c.unicode())) {
            ++invisible;
            continue;
        }
        text += c;
    }
    if (invisible > 0) {
        record(InputModificationKind::InvisibleUnicodeRemoved,
               QStringLiteral("Removed %1 invisible Unicode character(s)").arg(invisible));
    }

    // 2. control characters except newline and tab
    QString cleaned;
    cleaned.reserve(text.size());
    int controls = 0;
    for (const QChar c : std::as_const(text)) {
        if (c.category() == QChar::Other_Control
            && c != QLatin1Char('\n') && c != QLatin1Char('\t')) {
            ++controls;
            continue;
        }
        cleaned += c;
    }
    if (controls > 0) {
        record(InputModificationKind::ControlCharacterRemoved,
               QStringLiteral("Removed %1 control character(s)").arg(controls));
    }
    text = cleaned;

    // 3. injection phrases
    int injections = 0;
    for (const auto& p : m_registry->injection()) {
        qsizetype pos = 0;
        while (true) {
            const auto m = p.regex.match(text, pos);
            if (!m.hasMatch() || m.capturedLength(0) == 0)
                break;
            text.replace(m.capturedStart(0), m.capturedLength(0), m_options.redactionMarker);
            pos = m.capturedStart(0) + m_options.redactionMarker.size();
            ++injections;
        }
    }
    if (injections > 0) {
        record(InputModificationKind::InjectionPatternRemoved,
               QStringLiteral("Filtered %1 prompt injection pattern(s)").arg(injections));
    }

    // 4. length
    if (text.size() > m_options.maxLength) {
        const qsizetype original = text.size();
        text.truncate(truncationPoint(text, m_options.maxLength));
        record(InputModificationKind::ExcessiveLengthTruncated,
               QStringLiteral("Truncated from %1 to %2 characters").arg(original).arg(text.size()));
    }

    out.text = text;
    return out;
}

QString InputSanitizer::wrapForPrompt(const QString& text) {
    return QStringLiteral("<PATIENT_QUERY>\n%1\n</PATIENT_QUERY>").arg(text);
}

namespace Names {

QString modification(InputModificationKind kind) {
    switch (kind) {
    case InputModificationKind::InvisibleUnicodeRemoved:  return QStringLiteral("invisible_unicode_removed");
    case InputModificationKind::ControlCharacterRemoved:  return QStringLiteral("control_character_removed");
    case InputModificationKind::InjectionPatternRemoved:  return QStringLiteral("injection_pattern_removed");
    case InputModificationKind::ExcessiveLengthTruncated: return QStringLiteral("excessive_length_truncated");
    }
    return QStringLiteral("unknown");
}

}
