#include <QTest>
#include "safety/output_sanitizer.h"

class TestOutputSanitizer : public QObject {
    Q_OBJECT

private slots:
    void testStripsThinkingBlock() {
        const QString raw = QStringLiteral(
            "internal reasoning<unused94>thought\nBOUNDARY_CHECK: understanding\nBody.");
        QCOMPARE(OutputSanitizer::clean(raw),
                 QStringLiteral("BOUNDARY_CHECK: understanding\nBody."));
    }

    void testStripsStrayTokens() {
        QCOMPARE(OutputSanitizer::clean(QStringLiteral("Hello<unused12> world <unused3>")),
                 QStringLiteral("Hello world"));
    }

    void testCleanLeavesPlainText() {
        QCOMPARE(OutputSanitizer::clean(QStringLiteral("  Plain answer.  ")),
                 QStringLiteral("Plain answer."));
    }

    void testTruncationDetection() {
        QVERIFY(OutputSanitizer::isLikelyTruncated(QStringLiteral("The result was")));
        QVERIFY(!OutputSanitizer::isLikelyTruncated(QStringLiteral("The result was normal.")));
        QVERIFY(!OutputSanitizer::isLikelyTruncated(QStringLiteral("Is it normal?")));
        QVERIFY(!OutputSanitizer::isLikelyTruncated(QStringLiteral("It said \"normal.\"")));
        QVERIFY(!OutputSanitizer::isLikelyTruncated(QString()));
    }

    void testShortListItemIsTruncated() {
        QVERIFY(OutputSanitizer::isLikelyTruncated(QStringLiteral("Your medications:\n- Metformin.")));
        QVERIFY(!OutputSanitizer::isLikelyTruncated(
            QStringLiteral("Your medications:\n- Metformin 500 mg twice daily with meals.")));
    }

    void testAppendDisclaimer() {
        const QString out = OutputSanitizer::appendDisclaimer(QStringLiteral("The result was"));
        QVERIFY(out.startsWith(QStringLiteral("The result was\n\n")));
        QVERIFY(out.endsWith(OutputSanitizer::truncationDisclaimer()));
        QVERIFY(!OutputSanitizer::isLikelyTruncated(out));
    }
};

QTEST_MAIN(TestOutputSanitizer)
#include "tst_output_sanitizer.moc"
