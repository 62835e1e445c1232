#pragma once
#include "types.h"
#include <QList>
#include <QString>

struct Citation {
    QString documentId;
    QString documentTitle;
    QString documentDate;       // empty when unknown
    QString professionalName;   // empty when unknown
    QString chunkText;
    double relevanceScore = 0.0;
};

struct CandidateResponse {
    QString text;
    BoundaryTag boundary = BoundaryTag::OutOfBounds;
    QList<Citation> citations;
    double confidence = 0.0;
    QueryIntent intent = QueryIntent::General;

    static CandidateResponse fromText(const QString& text,
                                      BoundaryTag boundary = BoundaryTag::Understanding) {
        CandidateResponse c;
        c.text = text;
        c.boundary = boundary;
        return c;
    }
};

namespace Names {
    QString boundary(BoundaryTag tag);
    QString intent(QueryIntent intent);
    BoundaryTag boundaryFromString(const QString& value);
    QueryIntent intentFromString(const QString& value);
}
