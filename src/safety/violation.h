#pragma once
#include "types.h"
#include <QList>
#include <QString>

// Created per filter invocation and never persisted. `matchedText` must not
// reach any log sink; `reason` is always a pattern description.
struct Violation {
    FilterLayer layer = FilterLayer::KeywordScan;
    ViolationCategory category = ViolationCategory::DiagnosticLanguage;
    QString matchedText;
    qsizetype offset = 0;   // UTF-16 code units into the scanned text
    qsizetype length = 0;
    QString reason;

    qsizetype end() const { return offset + length; }
    bool contains(const Violation& other) const {
        return other.offset >= offset && other.end() <= end();
    }
};

using ViolationList = QList<Violation>;

namespace Names {
    QString layer(FilterLayer layer);
    QString category(ViolationCategory category);
}

bool hasCategory(const ViolationList& violations, ViolationCategory category);
