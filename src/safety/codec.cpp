#include "codec.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace Codec {

namespace {

QString stringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey) {
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake).toString();
    return obj.value(QString::fromUtf8(camelKey)).toString();
}

double doubleEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey) {
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake).toDouble();
    return obj.value(QString::fromUtf8(camelKey)).toDouble();
}

QJsonArray citationsToJson(const QList<Citation>& citations) {
    QJsonArray arr;
    for (const auto& c : citations)
        arr.append(encodeCitation(c));
    return arr;
}

}

QJsonObject encodeCitation(const Citation& c) {
    QJsonObject obj;
    obj["document_id"] = c.documentId;
    obj["document_title"] = c.documentTitle;
    if (!c.documentDate.isEmpty())
        obj["document_date"] = c.documentDate;
    if (!c.professionalName.isEmpty())
        obj["professional_name"] = c.professionalName;
    obj["chunk_text"] = c.chunkText;
    obj["relevance_score"] = c.relevanceScore;
    return obj;
}

Citation decodeCitation(const QJsonObject& obj) {
    Citation c;
    c.documentId = stringEither(obj, "document_id", "documentId");
    c.documentTitle = stringEither(obj, "document_title", "documentTitle");
    c.documentDate = stringEither(obj, "document_date", "documentDate");
    c.professionalName = stringEither(obj, "professional_name", "professionalName");
    c.chunkText = stringEither(obj, "chunk_text", "chunkText");
    c.relevanceScore = doubleEither(obj, "relevance_score", "relevanceScore");
    return c;
}

Result<CandidateResponse> decodeCandidate(const QJsonObject& obj) {
    if (!obj.value("text").isString())
        return std::unexpected(SafetyFailure::invalidInput(
            "missing_text", "candidate requires a string 'text' field"));

    CandidateResponse c;
    c.text = obj.value("text").toString();
    c.boundary = Names::boundaryFromString(obj.value("boundary").toString());
    c.intent = Names::intentFromString(stringEither(obj, "query_intent", "queryIntent"));
    c.confidence = obj.value("confidence").toDouble();
    for (const auto& v : obj.value("citations").toArray())
        c.citations.append(decodeCitation(v.toObject()));
    return c;
}

Result<CandidateResponse> decodeCandidate(const QByteArray& json) {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::unexpected(SafetyFailure::invalidInput(
            "invalid_json", err.error != QJsonParseError::NoError
                                ? err.errorString()
                                : QStringLiteral("expected a JSON object")));
    return decodeCandidate(doc.object());
}

QJsonObject encodeCandidate(const CandidateResponse& c) {
    QJsonObject obj;
    obj["text"] = c.text;
    obj["boundary"] = Names::boundary(c.boundary);
    obj["query_intent"] = Names::intent(c.intent);
    obj["confidence"] = c.confidence;
    obj["citations"] = citationsToJson(c.citations);
    return obj;
}

QJsonObject encodeViolation(const Violation& v) {
    QJsonObject obj;
    obj["layer"] = Names::layer(v.layer);
    obj["category"] = Names::category(v.category);
    obj["offset"] = static_cast<qint64>(v.offset);
    obj["length"] = static_cast<qint64>(v.length);
    obj["reason"] = v.reason;
    return obj;
}

QJsonObject encodeFiltered(const FilteredResponse& r) {
    QJsonObject obj;
    obj["outcome"] = Names::outcome(r.kind());
    obj["text"] = r.text;
    obj["boundary"] = Names::boundary(r.boundary);
    obj["query_intent"] = Names::intent(r.intent);
    obj["confidence"] = r.confidence;
    obj["citations"] = citationsToJson(r.citations);

    QJsonArray violations;
    for (const auto& v : outcomeViolations(r.outcome))
        violations.append(encodeViolation(v));
    obj["violations"] = violations;
    return obj;
}

QJsonObject encodeSanitized(const SanitizedInput& input) {
    QJsonObject obj;
    obj["text"] = input.text;
    obj["was_modified"] = input.wasModified;
    QJsonArray mods;
    for (const auto& m : input.modifications) {
        QJsonObject mo;
        mo["kind"] = Names::modification(m.kind);
        mo["description"] = m.description;
        mods.append(mo);
    }
    obj["modifications"] = mods;
    return obj;
}

}
