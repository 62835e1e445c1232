#pragma once
#include "candidate.h"
#include "ports.h"

namespace Validate {
    VoidResult candidate(const CandidateResponse& candidate);
    VoidResult query(const QString& raw);
}
