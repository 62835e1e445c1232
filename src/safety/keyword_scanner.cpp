#include "keyword_scanner.h"
#include <algorithm>

namespace {

void collect(const QList<SafetyPattern>& group, const QString& text, ViolationList& out) {
    for (const auto& p : group) {
        auto it = p.regex.globalMatch(text);
        while (it.hasNext()) {
            const auto m = it.next();
            Violation v;
            v.layer = FilterLayer::KeywordScan;
            v.category = p.category;
            v.matchedText = m.captured(0);
            v.offset = m.capturedStart(0);
            v.length = m.capturedLength(0);
            v.reason = p.description;
            out.append(v);
        }
    }
}

}

ViolationList KeywordScanner::scan(const QString& text) const {
    ViolationList out;
    if (!m_registry || text.isEmpty())
        return out;

    collect(m_registry->diagnostic(), text, out);
    collect(m_registry->prescriptive(), text, out);
    collect(m_registry->alarm(), text, out);
    deduplicate(out);
    return out;
}

void KeywordScanner::deduplicate(ViolationList& violations) {
    std::stable_sort(violations.begin(), violations.end(),
                     [](const Violation& a, const Violation& b) {
        if (a.offset != b.offset)
            return a.offset < b.offset;
        return a.length > b.length;
    });

    ViolationList kept;
    kept.reserve(violations.size());
    for (const auto& v : violations) {
        const bool contained = std::any_of(kept.cbegin(), kept.cend(),
                                           [&](const Violation& k) { return k.contains(v); });
        if (!contained)
            kept.append(v);
    }
    violations = kept;
}
