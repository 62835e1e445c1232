#include "rephrase_engine.h"
#include <algorithm>

namespace {

const QString kAlarmFallback = QStringLiteral(
    "I can help you understand what your medical documents say. If anything in "
    "them raises a question, your healthcare provider is the best person to talk to.");

const QString kPrescriptiveFallback = QStringLiteral(
    "I can share what your documents say, but questions about treatment or "
    "medication are best discussed with your healthcare provider. You might want "
    "to bring this up at your next appointment.");

const QString kDiagnosticFallback = QStringLiteral(
    "I can share what your documents say, but I'm not able to make diagnoses. "
    "Would you like me to explain what your documents mention?");

const QString kGenericFallback = QStringLiteral(
    "I can help you understand what your medical documents say. Could you "
    "rephrase your question about your documents?");

QString expandTemplate(const QString& tmpl, const QRegularExpressionMatch& match) {
    QString out;
    out.reserve(tmpl.size());
    for (qsizetype i = 0; i < tmpl.size(); ++i) {
        const QChar c = tmpl.at(i);
        if (c == QLatin1Char('\\') && i + 1 < tmpl.size() && tmpl.at(i + 1).isDigit()) {
            out += match.captured(tmpl.at(i + 1).digitValue());
            ++i;
        } else {
            out += c;
        }
    }
    return out;
}

int severity(ViolationCategory category) {
    switch (category) {
    case ViolationCategory::AlarmLanguage:        return 3;
    case ViolationCategory::PrescriptiveLanguage: return 2;
    case ViolationCategory::DiagnosticLanguage:   return 1;
    case ViolationCategory::UngroundedClaim:
    case ViolationCategory::BoundaryViolation:    return 0;
    }
    return 0;
}

}

QString RephraseEngine::boundaryFallback() { return kGenericFallback; }
QString RephraseEngine::genericFallback() { return kGenericFallback; }

QString RephraseEngine::selectFallback(const ViolationList& violations) {
    int worst = 0;
    for (const auto& v : violations)
        worst = qMax(worst, severity(v.category));

    switch (worst) {
    case 3: return kAlarmFallback;
    case 2: return kPrescriptiveFallback;
    case 1: return kDiagnosticFallback;
    default: return kGenericFallback;
    }
}

std::optional<QString> RephraseEngine::rephrase(const QString& text,
                                                const ViolationList& violations) const {
    if (violations.isEmpty())
        return text;
    if (!m_registry || hasCategory(violations, ViolationCategory::BoundaryViolation))
        return std::nullopt;

    ViolationList ordered = violations;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Violation& a, const Violation& b) {
        if (a.offset != b.offset)
            return a.offset > b.offset;
        return a.length > b.length;
    });

    QString current = text;
    // Start of the lowest region rewritten so far. Text before it still has
    // its original offsets.
    qsizetype rewrittenFrom = text.size() + 1;

    for (const auto& v : ordered) {
        if (v.offset < 0 || v.end() > text.size())
            return std::nullopt;
        if (v.end() > rewrittenFrom)
            continue;   // covered

        bool fixed = false;
        for (const auto& rule : m_registry->rulesFor(v.category)) {
            const auto m = rule.pattern.match(current, v.offset,
                                              QRegularExpression::NormalMatch,
                                              QRegularExpression::AnchorAtOffsetMatchOption);
            if (!m.hasMatch() || m.capturedLength(0) == 0)
                continue;
            if (m.capturedEnd(0) > rewrittenFrom)
                continue;

            QString replacement = expandTemplate(rule.replacement, m);
            const QString original = m.captured(0);
            if (!replacement.isEmpty() && original.at(0).isUpper())
                replacement[0] = replacement.at(0).toUpper();

            current.replace(m.capturedStart(0), m.capturedLength(0), replacement);
            rewrittenFrom = m.capturedStart(0);
            fixed = true;
            break;
        }
        if (!fixed)
            return std::nullopt;
    }
    return current;
}
