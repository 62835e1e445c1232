#pragma once
#include <QtGlobal>

enum class BoundaryTag : quint8 {
    Understanding, Awareness, Preparation, OutOfBounds
};

enum class QueryIntent : quint8 {
    Factual, Exploratory, Symptom, Timeline, General
};

enum class FilterLayer : quint8 {
    BoundaryCheck,       // Layer 1
    KeywordScan,         // Layer 2
    ReportingVsStating   // Layer 3
};

enum class ViolationCategory : quint8 {
    BoundaryViolation,
    DiagnosticLanguage,
    PrescriptiveLanguage,
    AlarmLanguage,
    UngroundedClaim
};

enum class InputModificationKind : quint8 {
    InvisibleUnicodeRemoved,
    ControlCharacterRemoved,
    InjectionPatternRemoved,
    ExcessiveLengthTruncated
};

enum class OutcomeKind : quint8 {
    Passed, Rephrased, Blocked
};

enum class ErrorKind : quint8 {
    InvalidInput,
    InvalidPattern,
    Unavailable,
    Internal
};
