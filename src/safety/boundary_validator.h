#pragma once
#include "candidate.h"
#include "violation.h"
#include <QString>

struct TaggedOutput {
    BoundaryTag tag = BoundaryTag::OutOfBounds;
    QString body;
};

// Layer 1. Checks the generator's self-reported boundary tag. A failing
// response is never rephrased; the caller regenerates or shows the
// boundary fallback.
class BoundaryValidator {
public:
    static constexpr int kDefaultMaxRegenerations = 2;

    ViolationList check(BoundaryTag tag) const;
    ViolationList check(const CandidateResponse& candidate) const {
        return check(candidate.boundary);
    }

    static bool isAllowed(BoundaryTag tag);

    // Reads a leading "BOUNDARY_CHECK: <value>" line. Without one the tag is
    // OutOfBounds and the text is returned unchanged.
    static TaggedOutput parseTaggedOutput(const QString& raw);
};
