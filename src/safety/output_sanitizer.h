#pragma once
#include <QString>

// Cleans raw generator output before it is tag-parsed and filtered.
namespace OutputSanitizer {
    // Drops a leading thinking block ("...<unusedN>thought\n") and any stray
    // <unusedN> tokens, then trims.
    QString clean(const QString& raw);

    bool isLikelyTruncated(const QString& text);

    QString truncationDisclaimer();
    QString appendDisclaimer(const QString& text);
}
