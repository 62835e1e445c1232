#include "pattern_registry.h"
#include "violation.h"

namespace {

using VC = ViolationCategory;

bool isRephrasable(ViolationCategory category) {
    switch (category) {
    case VC::BoundaryViolation:
        return false;
    case VC::DiagnosticLanguage:
    case VC::PrescriptiveLanguage:
    case VC::AlarmLanguage:
    case VC::UngroundedClaim:
        return true;
    }
    return false;
}

const QList<ViolationCategory> kAllCategories = {
    VC::BoundaryViolation,
    VC::DiagnosticLanguage,
    VC::PrescriptiveLanguage,
    VC::AlarmLanguage,
    VC::UngroundedClaim,
};

// Statements about the patient, shared by the Diagnostic and Ungrounded
// rule sets. Specific forms come before the generic "you have".
QList<RuleDef> claimRules(ViolationCategory category) {
    return {
        {category, QStringLiteral(R"(\byou\s+have\s+(?:any\s+|a\s+|more\s+|further\s+)?(?:questions?|concerns?)\b)"),
         QStringLiteral("anything is unclear")},
        {category, QStringLiteral(R"(\byou\s+(?:are|were|have\s+been)\s+(?:diagnosed|labell?ed|classified)(?:\s+(?:with|as))?\b)"),
         QStringLiteral("your documents mention a diagnosis of")},
        {category, QStringLiteral(R"(\byou(?:'ve|\s+have)\s+been\s+(experiencing|having|showing)\b)"),
         QStringLiteral("your records describe \\1")},
        {category, QStringLiteral(R"(\byou\s+have\s+been\s+(prescribed|given|treated|referred)\b)"),
         QStringLiteral("your records show you were \\1")},
        {category, QStringLiteral(R"(\byou(?:'re|\s+are)\s+(?:an?\s+)?(diabetic|hypertensive|anemic|asthmatic|allergic|obese|overweight|immunocompromised)\b)"),
         QStringLiteral("your records mention being \\1")},
        {category, QStringLiteral(R"(\byou\s+have(?=\s+\w)(?!\s+(?:been|to)\b))"),
         QStringLiteral("your documents mention")},
    };
}

}

PatternTable PatternTable::defaults() {
    PatternTable t;

    // ---- Layer 2: diagnostic ----
    t.diagnostic = {
        {QStringLiteral(R"(\byou\s+have\s+(?:a\s+)?(?:been\s+)?(?:diagnosed\s+with\s+)?[a-z])"),
         VC::DiagnosticLanguage, QStringLiteral("Direct diagnosis: 'you have [condition]'")},
        {QStringLiteral(R"(\byou\s+are\s+suffering\s+from\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Direct diagnosis: 'you are suffering from'")},
        {QStringLiteral(R"(\byou\s+(?:likely|probably|possibly)\s+have\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Speculative diagnosis: 'you likely/probably have'")},
        {QStringLiteral(R"(\bthis\s+(?:means|indicates|suggests|confirms)\s+(?:you|that\s+you)\s+have\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Indirect diagnosis: 'this means you have'")},
        {QStringLiteral(R"(\byou\s+(?:are|have\s+been)\s+diagnosed\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Diagnosis claim without document attribution")},
        {QStringLiteral(R"(\byou(?:'re|\s+are)\s+(?:a\s+)?diabetic\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Direct label: 'you are diabetic'")},
        {QStringLiteral(R"(\byour\s+condition\s+is\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Condition assertion: 'your condition is'")},
        {QStringLiteral(R"(\byou\s+(?:appear|seem)\s+to\s+have\b)"),
         VC::DiagnosticLanguage, QStringLiteral("Implied diagnosis: 'you appear to have'")},
    };

    // ---- Layer 2: prescriptive ----
    t.prescriptive = {
        {QStringLiteral(R"(\byou\s+should\s+(?:take|stop|start|increase|decrease|change|switch|discontinue|avoid|reduce)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Direct prescription: 'you should [take/stop/...]'")},
        {QStringLiteral(R"(\bI\s+recommend\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Direct recommendation: 'I recommend'")},
        {QStringLiteral(R"(\bI\s+(?:would\s+)?(?:suggest|advise)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Advisory language: 'I suggest/advise'")},
        {QStringLiteral(R"(\byou\s+(?:need|must|have)\s+to\s+(?:take|stop|start|see|visit|go|call|increase|decrease)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Imperative prescription: 'you need to [action]'")},
        {QStringLiteral(R"(\bdo\s+not\s+(?:take|stop|eat|drink|use|skip)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Prohibition: 'do not [action]'")},
        {QStringLiteral(R"(\btry\s+(?:taking|using|adding|reducing)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Soft prescription: 'try taking/using'")},
        {QStringLiteral(R"(\bthe\s+(?:best|recommended)\s+(?:treatment|course\s+of\s+action|approach)\s+(?:is|would\s+be)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Treatment recommendation: 'the best treatment is'")},
        {QStringLiteral(R"(\bconsider\s+(?:taking|stopping|increasing|decreasing|switching)\b)"),
         VC::PrescriptiveLanguage, QStringLiteral("Soft prescription: 'consider taking/stopping'")},
    };

    // ---- Layer 2: alarm ----
    t.alarm = {
        {QStringLiteral(R"(\b(?:dangerous|life[- ]threatening|fatal|deadly|lethal)\b)"),
         VC::AlarmLanguage, QStringLiteral("Alarm word: dangerous/life-threatening/fatal")},
        {QStringLiteral(R"(\b(?:emergency|urgent(?:ly)?|immediately|right\s+away|right\s+now)\b)"),
         VC::AlarmLanguage, QStringLiteral("Urgency word: emergency/immediately/urgently")},
        {QStringLiteral(R"(\b(?:immediately|urgently)\s+(?:go|call|visit|see|seek|get)\b)"),
         VC::AlarmLanguage, QStringLiteral("Urgent directive: 'immediately go/call'")},
        {QStringLiteral(R"(\bcall\s+(?:911|emergency|an\s+ambulance|your\s+doctor\s+(?:immediately|right\s+away|now))\b)"),
         VC::AlarmLanguage, QStringLiteral("Emergency call directive: 'call 911/emergency'")},
        {QStringLiteral(R"(\bgo\s+to\s+(?:the\s+)?(?:emergency|ER|hospital|A&E)\b)"),
         VC::AlarmLanguage, QStringLiteral("ER directive: 'go to the emergency/hospital'")},
        {QStringLiteral(R"(\bseek\s+(?:immediate|emergency|urgent)\s+(?:medical\s+)?(?:help|attention|care)\b)"),
         VC::AlarmLanguage, QStringLiteral("Seek care directive: 'seek immediate medical help'")},
        {QStringLiteral(R"(\bthis\s+(?:is|could\s+be)\s+(?:a\s+)?(?:medical\s+)?emergency\b)"),
         VC::AlarmLanguage, QStringLiteral("Emergency declaration: 'this is an emergency'")},
        {QStringLiteral(R"(\bdo\s+not\s+(?:wait|delay|ignore)\b)"),
         VC::AlarmLanguage, QStringLiteral("Urgency pressure: 'do not wait/delay'")},
    };

    // ---- Layer 3: claims about the patient ----
    t.ungrounded = {
        {QStringLiteral(R"(\byou\s+have\s+(?:a\s+)?[a-z])"),
         VC::UngroundedClaim, QStringLiteral("Ungrounded: 'you have [condition]' without document reference")},
        {QStringLiteral(R"(\byou\s+are\s+(?:a\s+)?(?:diabetic|hypertensive|anemic|asthmatic|allergic|obese|overweight|immunocompromised)\b)"),
         VC::UngroundedClaim, QStringLiteral("Ungrounded label: 'you are [medical label]'")},
        {QStringLiteral(R"(\byou(?:'ve|\s+have)\s+been\s+(?:experiencing|having|showing)\b)"),
         VC::UngroundedClaim, QStringLiteral("Ungrounded observation: 'you have been experiencing'")},
        {QStringLiteral(R"(\byour\s+(?:blood\s+pressure|cholesterol|glucose|sugar|levels?|count|heart\s+rate|weight|BMI)\s+(?:is|are)\s+(?:high|low|elevated|abnormal|concerning|worrying|critical)\b)"),
         VC::UngroundedClaim, QStringLiteral("Ungrounded value judgment: 'your [metric] is [judgment]'")},
        {QStringLiteral(R"(\byou\s+(?:are|were|have\s+been)\s+(?:diagnosed|labell?ed|classified)\s+(?:with|as)\b)"),
         VC::UngroundedClaim, QStringLiteral("Ungrounded diagnosis: 'you are diagnosed with/labeled as'")},
    };

    // ---- Layer 3: attribution ----
    t.grounded = {
        {QStringLiteral("document attribution"),
         QStringLiteral(R"(\byour\s+(?:documents?|records?|reports?|results?|files?|lab\s+results?|test\s+results?|medical\s+records?)\s+(?:show|indicate|mention|state|note|reveal|suggest|describe|include|contain|list|record|reference)s?\b)")},
        {QStringLiteral("professional attribution"),
         QStringLiteral(R"(\b(?:Dr\.?\s+\w+|your\s+(?:doctor|physician|specialist|cardiologist|GP|practitioner|healthcare\s+provider))\s+(?:noted|wrote|documented|recorded|diagnosed|prescribed|mentioned|indicated|observed|stated|reported)\b)")},
        {QStringLiteral("passive document attribution"),
         QStringLiteral(R"(\b(?:according\s+to|based\s+on|as\s+(?:noted|stated|documented|recorded|mentioned)\s+in)\s+(?:your|the)\s+(?:documents?|records?|reports?|results?|files?|prescription|discharge\s+summary|clinical\s+notes?)\b)")},
        {QStringLiteral("inline citation"),
         QStringLiteral(R"(\[Doc:\s*[a-f0-9-]+)")},
        {QStringLiteral("date-of-record attribution"),
         QStringLiteral(R"(\b(?:in|on|from)\s+(?:your|the)\s+(?:January|February|March|April|May|June|July|August|September|October|November|December|\d{4}|\d{1,2}/\d{1,2}))")},
        {QStringLiteral("dated record"),
         QStringLiteral(R"(\b(?:recorded|documented|noted|dated)\s+(?:on\s+)?(?:\d{4}-\d{1,2}-\d{1,2}|\d{1,2}/\d{1,2}/\d{2,4}))")},
    };

    // ---- input sanitization ----
    t.injection = {
        {QStringLiteral("ignore previous instructions"),
         QStringLiteral(R"(ignore\s+(?:all\s+)?(?:previous|above|all\s+prior|prior|the\s+above)\s+(?:instructions?|rules?|prompts?))")},
        {QStringLiteral("disregard previous"),
         QStringLiteral(R"(disregard\s+(?:all\s+)?(?:previous|prior|above|the\s+above)(?:\s+(?:instructions?|rules?|prompts?))?)")},
        {QStringLiteral("forget instructions"),
         QStringLiteral(R"(forget\s+(?:everything|all|your)(?:\s+(?:previous|prior))?)")},
        {QStringLiteral("new instructions"),
         QStringLiteral(R"(new\s+instructions?\s*:)")},
        {QStringLiteral("role override"),
         QStringLiteral(R"(you\s+are\s+now\s+(?:a|an)\b)")},
        {QStringLiteral("system role tag"),
         QStringLiteral(R"(\bsystem\s*:)")},
        {QStringLiteral("assistant role tag"),
         QStringLiteral(R"(\bassistant\s*:)")},
        {QStringLiteral("llama system tag"),
         QStringLiteral(R"(<<\s*/?\s*SYS\s*>>)")},
        {QStringLiteral("instruction tag"),
         QStringLiteral(R"(\[/?INST\])")},
        {QStringLiteral("chatml tag"),
         QStringLiteral(R"(<\|im_(?:start|end)\|>)")},
        {QStringLiteral("xml system tag"),
         QStringLiteral(R"(</?system>)")},
        {QStringLiteral("jailbreak mode"),
         QStringLiteral(R"(\b(?:DAN|do\s+anything\s+now)\s+mode\b)")},
        {QStringLiteral("doctor impersonation"),
         QStringLiteral(R"(pretend\s+(?:you\s+are|to\s+be)\s+(?:a|an)\s+(?:doctor|physician|medical))")},
        {QStringLiteral("doctor role play"),
         QStringLiteral(R"(act\s+as\s+(?:a|an|my)\s+(?:doctor|physician|medical))")},
    };

    // ---- rephrase rules, in priority order per category ----
    t.rephraseRules = claimRules(VC::DiagnosticLanguage);
    t.rephraseRules += QList<RuleDef>{
        {VC::DiagnosticLanguage, QStringLiteral(R"(\byou\s+are\s+suffering\s+from\b)"),
         QStringLiteral("your records reference")},
        {VC::DiagnosticLanguage, QStringLiteral(R"(\byou\s+(?:likely|probably|possibly)\s+have\b)"),
         QStringLiteral("your documents may mention")},
        {VC::DiagnosticLanguage, QStringLiteral(R"(\bthis\s+(?:means|indicates|suggests|confirms)\s+(?:you|that\s+you)\s+have\b)"),
         QStringLiteral("your documents may mention")},
        {VC::DiagnosticLanguage, QStringLiteral(R"(\byour\s+condition\s+is\b)"),
         QStringLiteral("your documents describe your condition as")},
        {VC::DiagnosticLanguage, QStringLiteral(R"(\byou\s+(?:appear|seem)\s+to\s+have\b)"),
         QStringLiteral("your documents reference")},

        {VC::PrescriptiveLanguage, QStringLiteral(R"(\byou\s+should\s+(take|stop|start|increase|decrease|change|switch|discontinue|avoid|reduce)\b)"),
         QStringLiteral("you might want to discuss with your doctor whether to \\1")},
        {VC::PrescriptiveLanguage, QStringLiteral(R"(\bI\s+recommend\b)"),
         QStringLiteral("you may want to ask your healthcare provider about")},
        {VC::PrescriptiveLanguage, QStringLiteral(R"(\bI\s+(?:would\s+)?(?:suggest|advise)(?:\s+that)?\b)"),
         QStringLiteral("you may want to ask your doctor about")},
        {VC::PrescriptiveLanguage, QStringLiteral(R"(\byou\s+(?:need|must|have)\s+to\s+(take|stop|start|see|visit|go|call|increase|decrease)\b)"),
         QStringLiteral("you may want to talk with your healthcare provider about whether to \\1")},
        {VC::PrescriptiveLanguage, QStringLiteral(R"(\bdo\s+not\s+(take|stop|eat|drink|use|skip)\b)"),
         QStringLiteral("you might want to ask your doctor before you \\1")},
        {VC::PrescriptiveLanguage, QStringLiteral(R"(\b(?:try|consider)\s+(taking|using|adding|reducing|stopping|increasing|decreasing|switching)\b)"),
         QStringLiteral("you could ask your doctor about \\1")},
        {VC::PrescriptiveLanguage, QStringLiteral(R"(\bthe\s+(?:best|recommended)\s+(?:treatment|course\s+of\s+action|approach)\s+(?:is|would\s+be)\b)"),
         QStringLiteral("one option your healthcare provider could discuss is")},

        {VC::AlarmLanguage, QStringLiteral(R"(\b(?:immediately|urgently)\s+(go|call|visit|see|seek|get)\b)"),
         QStringLiteral("it may be helpful to \\1")},
        {VC::AlarmLanguage, QStringLiteral(R"(\bthis\s+(?:is|could\s+be)\s+(?:a\s+)?(?:medical\s+)?emergency\b)"),
         QStringLiteral("this is something you may want to discuss with your healthcare provider soon")},
        {VC::AlarmLanguage, QStringLiteral(R"(\bseek\s+(?:immediate|emergency|urgent)\s+(?:medical\s+)?(?:help|attention|care)\b)"),
         QStringLiteral("consider reaching out to your healthcare provider")},
        {VC::AlarmLanguage, QStringLiteral(R"(\bcall\s+(?:911|emergency(?:\s+services)?|an\s+ambulance|your\s+doctor\s+(?:immediately|right\s+away|now))\b)"),
         QStringLiteral("consider contacting your healthcare provider")},
        {VC::AlarmLanguage, QStringLiteral(R"(\bgo\s+to\s+(?:the\s+)?(?:emergency\s+(?:room|department)|emergency|ER|hospital|A&E)\b)"),
         QStringLiteral("consider visiting your healthcare provider")},
        {VC::AlarmLanguage, QStringLiteral(R"(\bdangerous\b)"),
         QStringLiteral("notable")},
        {VC::AlarmLanguage, QStringLiteral(R"(\b(?:life[- ]threatening|fatal|deadly|lethal)\b)"),
         QStringLiteral("significant")},
        {VC::AlarmLanguage, QStringLiteral(R"(\bdo\s+not\s+(?:wait|delay|ignore)\b)"),
         QStringLiteral("it may be worth bringing this up")},
        {VC::AlarmLanguage, QStringLiteral(R"(\b(?:immediately|urgently|right\s+away|right\s+now)\b)"),
         QStringLiteral("soon")},
        {VC::AlarmLanguage, QStringLiteral(R"(\burgent\b)"),
         QStringLiteral("timely")},
    };
    t.rephraseRules += claimRules(VC::UngroundedClaim);
    t.rephraseRules += QList<RuleDef>{
        {VC::UngroundedClaim, QStringLiteral(R"(\byour\s+(blood\s+pressure|cholesterol|glucose|sugar|levels?|count|heart\s+rate|weight|BMI)\s+(is|are)\s+(high|low|elevated|abnormal|concerning|worrying|critical)\b)"),
         QStringLiteral("your documents note that your \\1 \\2 \\3")},
    };

    return t;
}

QRegularExpression::PatternOptions PatternRegistry::patternOptions() {
    return QRegularExpression::CaseInsensitiveOption
         | QRegularExpression::UseUnicodePropertiesOption;
}

namespace {

Result<QRegularExpression> compile(const QString& expression, const QString& what) {
    QRegularExpression re(expression, PatternRegistry::patternOptions());
    if (!re.isValid()) {
        return std::unexpected(SafetyFailure::invalidPattern(
            QStringLiteral("invalid_regex"),
            QStringLiteral("%1: %2 at offset %3")
                .arg(what, re.errorString())
                .arg(re.patternErrorOffset())));
    }
    re.optimize();
    return re;
}

Result<QList<SafetyPattern>> compileGroup(const QList<PatternDef>& defs,
                                          ViolationCategory expected,
                                          const QString& group) {
    if (defs.isEmpty()) {
        return std::unexpected(SafetyFailure::invalidPattern(
            QStringLiteral("empty_group"),
            QStringLiteral("pattern group '%1' is empty").arg(group)));
    }
    QList<SafetyPattern> out;
    out.reserve(defs.size());
    for (const auto& def : defs) {
        if (def.category != expected) {
            return std::unexpected(SafetyFailure::invalidPattern(
                QStringLiteral("category_mismatch"),
                QStringLiteral("pattern '%1' in group '%2' has category %3")
                    .arg(def.description, group, Names::category(def.category))));
        }
        auto re = compile(def.expression, def.description);
        if (!re) return std::unexpected(re.error());
        out.append({*re, def.category, def.description});
    }
    return out;
}

Result<QList<LabeledPattern>> compileLabeled(const QList<LabeledDef>& defs,
                                             const QString& group) {
    if (defs.isEmpty()) {
        return std::unexpected(SafetyFailure::invalidPattern(
            QStringLiteral("empty_group"),
            QStringLiteral("pattern group '%1' is empty").arg(group)));
    }
    QList<LabeledPattern> out;
    out.reserve(defs.size());
    for (const auto& def : defs) {
        auto re = compile(def.expression, def.label);
        if (!re) return std::unexpected(re.error());
        out.append({def.label, *re});
    }
    return out;
}

int highestReference(const QString& replacement) {
    int highest = 0;
    for (qsizetype i = 0; i + 1 < replacement.size(); ++i) {
        if (replacement.at(i) == QLatin1Char('\\') && replacement.at(i + 1).isDigit())
            highest = qMax(highest, replacement.at(i + 1).digitValue());
    }
    return highest;
}

}

Result<std::shared_ptr<const PatternRegistry>> PatternRegistry::build(const PatternTable& table) {
    auto reg = std::make_shared<PatternRegistry>(Passkey{});

    auto diag = compileGroup(table.diagnostic, VC::DiagnosticLanguage, QStringLiteral("diagnostic"));
    if (!diag) return std::unexpected(diag.error());
    auto presc = compileGroup(table.prescriptive, VC::PrescriptiveLanguage, QStringLiteral("prescriptive"));
    if (!presc) return std::unexpected(presc.error());
    auto alarm = compileGroup(table.alarm, VC::AlarmLanguage, QStringLiteral("alarm"));
    if (!alarm) return std::unexpected(alarm.error());
    auto ungrounded = compileGroup(table.ungrounded, VC::UngroundedClaim, QStringLiteral("ungrounded"));
    if (!ungrounded) return std::unexpected(ungrounded.error());
    auto grounded = compileLabeled(table.grounded, QStringLiteral("grounded"));
    if (!grounded) return std::unexpected(grounded.error());
    auto injection = compileLabeled(table.injection, QStringLiteral("injection"));
    if (!injection) return std::unexpected(injection.error());

    reg->m_diagnostic = *diag;
    reg->m_prescriptive = *presc;
    reg->m_alarm = *alarm;
    reg->m_ungrounded = *ungrounded;
    reg->m_grounded = *grounded;
    reg->m_injection = *injection;

    for (const auto& def : table.rephraseRules) {
        const QString what = QStringLiteral("rephrase rule for %1").arg(Names::category(def.category));
        if (!isRephrasable(def.category)) {
            return std::unexpected(SafetyFailure::invalidPattern(
                QStringLiteral("unrephrasable_category"), what));
        }
        auto re = compile(def.expression, what);
        if (!re) return std::unexpected(re.error());
        if (highestReference(def.replacement) > re->captureCount()) {
            return std::unexpected(SafetyFailure::invalidPattern(
                QStringLiteral("bad_capture_reference"),
                QStringLiteral("%1 refers to a missing capture group").arg(what)));
        }
        reg->m_rules[def.category].append({*re, def.replacement, def.category});
    }

    for (auto category : kAllCategories) {
        if (isRephrasable(category) && reg->m_rules.value(category).isEmpty()) {
            return std::unexpected(SafetyFailure::invalidPattern(
                QStringLiteral("missing_rules"),
                QStringLiteral("no rephrase rules for category %1").arg(Names::category(category))));
        }
    }

    return std::shared_ptr<const PatternRegistry>(std::move(reg));
}

QList<RephraseRule> PatternRegistry::rulesFor(ViolationCategory category) const {
    return m_rules.value(category);
}
