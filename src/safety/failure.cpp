#include "failure.h"

QString SafetyFailure::kindName() const {
    switch (kind) {
    case ErrorKind::InvalidInput:   return QStringLiteral("invalid_input");
    case ErrorKind::InvalidPattern: return QStringLiteral("invalid_pattern");
    case ErrorKind::Unavailable:    return QStringLiteral("unavailable");
    case ErrorKind::Internal:
    default:                        return QStringLiteral("internal");
    }
}

QJsonObject SafetyFailure::toJson() const {
    QJsonObject err;
    err["code"] = code;
    err["message"] = message;
    err["type"] = kindName();
    err["retryable"] = retryable;
    QJsonObject root;
    root["error"] = err;
    return root;
}

SafetyFailure SafetyFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false};
}

SafetyFailure SafetyFailure::invalidPattern(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidPattern, code, msg, false};
}

SafetyFailure SafetyFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, "unavailable", msg, true};
}

SafetyFailure SafetyFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false};
}
