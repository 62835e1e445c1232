#include "boundary_validator.h"

namespace {
const QString kTagPrefix = QStringLiteral("BOUNDARY_CHECK:");
}

bool BoundaryValidator::isAllowed(BoundaryTag tag) {
    switch (tag) {
    case BoundaryTag::Understanding:
    case BoundaryTag::Awareness:
    case BoundaryTag::Preparation:
        return true;
    case BoundaryTag::OutOfBounds:
        return false;
    }
    return false;
}

ViolationList BoundaryValidator::check(BoundaryTag tag) const {
    if (isAllowed(tag))
        return {};

    Violation v;
    v.layer = FilterLayer::BoundaryCheck;
    v.category = ViolationCategory::BoundaryViolation;
    v.reason = QStringLiteral("Response boundary is %1").arg(Names::boundary(tag));
    return {v};
}

TaggedOutput BoundaryValidator::parseTaggedOutput(const QString& raw) {
    const QString trimmed = raw.trimmed();
    const qsizetype newline = trimmed.indexOf(QLatin1Char('\n'));
    const QString firstLine = newline < 0 ? trimmed : trimmed.left(newline);

    if (!firstLine.startsWith(kTagPrefix, Qt::CaseInsensitive))
        return {BoundaryTag::OutOfBounds, raw};

    TaggedOutput out;
    out.tag = Names::boundaryFromString(firstLine.mid(kTagPrefix.size()));
    out.body = newline < 0 ? QString() : trimmed.mid(newline + 1).trimmed();
    return out;
}
