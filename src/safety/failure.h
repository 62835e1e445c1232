#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct SafetyFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;

    QString kindName() const;
    QJsonObject toJson() const;

    static SafetyFailure invalidInput(const QString& code, const QString& msg);
    static SafetyFailure invalidPattern(const QString& code, const QString& msg);
    static SafetyFailure unavailable(const QString& msg);
    static SafetyFailure internal(const QString& msg);
};
