#include "validate.h"
#include <QStringView>

namespace Validate {

VoidResult candidate(const CandidateResponse& c) {
    if (!QStringView(c.text).isValidUtf16())
        return std::unexpected(SafetyFailure::invalidInput(
            "malformed_text", "candidate text is not valid UTF-16"));
    return {};
}

VoidResult query(const QString& raw) {
    if (!QStringView(raw).isValidUtf16())
        return std::unexpected(SafetyFailure::invalidInput(
            "malformed_query", "query is not valid UTF-16"));
    return {};
}

}
