#include "grounding_checker.h"
#include "keyword_scanner.h"
#include <QStringList>

namespace {

const QStringList kAbbreviations = {
    QStringLiteral("dr"), QStringLiteral("mr"), QStringLiteral("mrs"),
    QStringLiteral("ms"), QStringLiteral("prof"), QStringLiteral("jr"),
    QStringLiteral("sr"), QStringLiteral("st"), QStringLiteral("vs"),
    QStringLiteral("etc"), QStringLiteral("e.g"), QStringLiteral("i.e"),
    QStringLiteral("approx"), QStringLiteral("dept"), QStringLiteral("est"),
    QStringLiteral("avg"), QStringLiteral("max"), QStringLiteral("min"),
    QStringLiteral("vol"), QStringLiteral("no"), QStringLiteral("pt"),
};

// `dot` is the index of a '.' in `text`.
bool endsAbbreviation(const QString& text, qsizetype dot) {
    for (const auto& abbr : kAbbreviations) {
        const qsizetype start = dot - abbr.size();
        if (start < 0)
            continue;
        if (QStringView(text).mid(start, abbr.size()).compare(abbr, Qt::CaseInsensitive) != 0)
            continue;
        if (start == 0 || !text.at(start - 1).isLetter())
            return true;
    }
    return false;
}

bool isBreakAfter(const QString& text, qsizetype i) {
    const QChar c = text.at(i);
    if (c != QLatin1Char('.') && c != QLatin1Char('!') && c != QLatin1Char('?'))
        return false;

    qsizetype j = i + 1;
    if (j >= text.size() || !text.at(j).isSpace())
        return false;
    while (j < text.size() && text.at(j).isSpace())
        ++j;
    if (j >= text.size() || !text.at(j).isUpper())
        return false;

    return c != QLatin1Char('.') || !endsAbbreviation(text, i);
}

void emitSentence(const QString& text, qsizetype begin, qsizetype end, QList<Sentence>& out) {
    while (begin < end && text.at(begin).isSpace())
        ++begin;
    while (end > begin && text.at(end - 1).isSpace())
        --end;
    if (begin < end)
        out.append({text.mid(begin, end - begin), begin});
}

}

QList<Sentence> GroundingChecker::splitSentences(const QString& text) {
    QList<Sentence> out;
    qsizetype start = 0;
    for (qsizetype i = 0; i < text.size(); ++i) {
        if (text.at(i) == QLatin1Char('\n')) {
            emitSentence(text, start, i, out);
            start = i + 1;
        } else if (isBreakAfter(text, i)) {
            emitSentence(text, start, i + 1, out);
            start = i + 1;
        }
    }
    emitSentence(text, start, text.size(), out);
    return out;
}

bool GroundingChecker::isGrounded(const QString& sentence) const {
    for (const auto& p : m_registry->grounded()) {
        if (p.regex.match(sentence).hasMatch())
            return true;
    }
    return false;
}

ViolationList GroundingChecker::check(const QString& text) const {
    ViolationList out;
    if (!m_registry || text.isEmpty())
        return out;

    for (const auto& sentence : splitSentences(text)) {
        ViolationList claims;
        for (const auto& p : m_registry->ungrounded()) {
            auto it = p.regex.globalMatch(sentence.text);
            while (it.hasNext()) {
                const auto m = it.next();
                Violation v;
                v.layer = FilterLayer::ReportingVsStating;
                v.category = ViolationCategory::UngroundedClaim;
                v.matchedText = m.captured(0);
                v.offset = sentence.offset + m.capturedStart(0);
                v.length = m.capturedLength(0);
                v.reason = p.description;
                claims.append(v);
            }
        }
        if (claims.isEmpty() || isGrounded(sentence.text))
            continue;
        KeywordScanner::deduplicate(claims);
        out += claims;
    }
    return out;
}
