#include "output_sanitizer.h"
#include <QRegularExpression>

namespace OutputSanitizer {

namespace {
const QRegularExpression kThinkingBlock(QStringLiteral(R"(^[\s\S]*<unused\d+>thought\n)"));
const QRegularExpression kUnusedToken(QStringLiteral(R"(<unused\d+>)"));
const QString kTerminal = QStringLiteral(".!?:\")]");
constexpr int kShortListItem = 20;
}

QString clean(const QString& raw) {
    QString text = raw;
    text.remove(kThinkingBlock);
    text.remove(kUnusedToken);
    return text.trimmed();
}

bool isLikelyTruncated(const QString& text) {
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return false;

    if (!kTerminal.contains(trimmed.back()))
        return true;

    const QString lastLine = trimmed.section(QLatin1Char('\n'), -1).trimmed();
    const bool listItem = lastLine.startsWith(QLatin1Char('-')) || lastLine.startsWith(QLatin1Char('*'));
    return listItem && lastLine.size() < kShortListItem;
}

QString truncationDisclaimer() {
    return QStringLiteral("This response may be incomplete. For comprehensive information "
                          "about this topic, please consult your healthcare provider.");
}

QString appendDisclaimer(const QString& text) {
    return text + QStringLiteral("\n\n") + truncationDisclaimer();
}

}
