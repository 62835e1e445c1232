#pragma once
#include "safety/boundary_validator.h"
#include <QString>

struct InputOptions {
    int maxLength = 2000;
    QString redactionMarker = QStringLiteral("[FILTERED]");
};

struct FilterSettings {
    int maxRephraseViolations = 3;
    int maxBoundaryRegenerations = BoundaryValidator::kDefaultMaxRegenerations;
    bool appendTruncationDisclaimer = true;
};

struct RuntimeOptions {
    bool debugMode = false;
    QString logDir;     // empty = no log file
};

struct SafetyConfig {
    InputOptions input;
    FilterSettings filter;
    RuntimeOptions runtime;

    bool isValid() const {
        return input.maxLength > 0
            && !input.redactionMarker.isEmpty()
            && filter.maxRephraseViolations >= 0
            && filter.maxBoundaryRegenerations >= 0;
    }
};
