#pragma once
#include "ports.h"
#include "types.h"
#include <QList>
#include <QMap>
#include <QRegularExpression>
#include <QString>
#include <memory>

// ---- raw definitions (what gets compiled) ----

struct PatternDef {
    QString expression;
    ViolationCategory category = ViolationCategory::DiagnosticLanguage;
    QString description;
};

struct LabeledDef {
    QString label;
    QString expression;
};

struct RuleDef {
    ViolationCategory category = ViolationCategory::DiagnosticLanguage;
    QString expression;
    QString replacement;    // \1..\9 refer to capture groups
};

struct PatternTable {
    QList<PatternDef> diagnostic;
    QList<PatternDef> prescriptive;
    QList<PatternDef> alarm;
    QList<PatternDef> ungrounded;
    QList<LabeledDef> grounded;
    QList<LabeledDef> injection;
    QList<RuleDef> rephraseRules;

    static PatternTable defaults();
};

// ---- compiled forms ----

struct SafetyPattern {
    QRegularExpression regex;
    ViolationCategory category = ViolationCategory::DiagnosticLanguage;
    QString description;
};

struct LabeledPattern {
    QString label;
    QRegularExpression regex;
};

struct RephraseRule {
    QRegularExpression pattern;
    QString replacement;
    ViolationCategory category = ViolationCategory::DiagnosticLanguage;
};

// Immutable after build(); share it as a const pointer across threads.
class PatternRegistry {
public:
    static Result<std::shared_ptr<const PatternRegistry>> build(
        const PatternTable& table = PatternTable::defaults());

    const QList<SafetyPattern>& diagnostic() const { return m_diagnostic; }
    const QList<SafetyPattern>& prescriptive() const { return m_prescriptive; }
    const QList<SafetyPattern>& alarm() const { return m_alarm; }
    const QList<SafetyPattern>& ungrounded() const { return m_ungrounded; }
    const QList<LabeledPattern>& grounded() const { return m_grounded; }
    const QList<LabeledPattern>& injection() const { return m_injection; }

    // Rules for one category, in priority order. Empty for BoundaryViolation.
    QList<RephraseRule> rulesFor(ViolationCategory category) const;

    static QRegularExpression::PatternOptions patternOptions();

private:
    struct Passkey { explicit Passkey() = default; };

public:
    // Only build() can name Passkey.
    explicit PatternRegistry(Passkey) {}

private:

    QList<SafetyPattern> m_diagnostic;
    QList<SafetyPattern> m_prescriptive;
    QList<SafetyPattern> m_alarm;
    QList<SafetyPattern> m_ungrounded;
    QList<LabeledPattern> m_grounded;
    QList<LabeledPattern> m_injection;
    QMap<ViolationCategory, QList<RephraseRule>> m_rules;
};

using RegistryPtr = std::shared_ptr<const PatternRegistry>;
