#pragma once
#include "input_sanitizer.h"
#include "outcome.h"
#include "ports.h"
#include <QJsonObject>

// JSON forms used by the CLI. Encoded violations carry positions and
// descriptions only, never the matched text.
namespace Codec {
    Result<CandidateResponse> decodeCandidate(const QJsonObject& obj);
    Result<CandidateResponse> decodeCandidate(const QByteArray& json);

    QJsonObject encodeCandidate(const CandidateResponse& candidate);
    QJsonObject encodeCitation(const Citation& citation);
    Citation decodeCitation(const QJsonObject& obj);
    QJsonObject encodeViolation(const Violation& violation);
    QJsonObject encodeFiltered(const FilteredResponse& response);
    QJsonObject encodeSanitized(const SanitizedInput& input);
}
