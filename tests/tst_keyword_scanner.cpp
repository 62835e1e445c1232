#include <QTest>
#include "safety/keyword_scanner.h"

class TestKeywordScanner : public QObject {
    Q_OBJECT

private:
    RegistryPtr m_registry;

    static Violation span(qsizetype offset, qsizetype length) {
        Violation v;
        v.offset = offset;
        v.length = length;
        return v;
    }

private slots:
    void initTestCase() {
        auto reg = PatternRegistry::build();
        QVERIFY(reg.has_value());
        m_registry = *reg;
    }

    void testDiagnostic() {
        KeywordScanner scanner(m_registry);
        const auto v = scanner.scan(QStringLiteral("You have diabetes."));
        QCOMPARE(v.size(), 1);
        QCOMPARE(v[0].category, ViolationCategory::DiagnosticLanguage);
        QCOMPARE(v[0].layer, FilterLayer::KeywordScan);
        QCOMPARE(v[0].offset, qsizetype(0));
        QCOMPARE(v[0].matchedText, QStringLiteral("You have d"));
    }

    void testPrescriptive() {
        KeywordScanner scanner(m_registry);
        const auto v = scanner.scan(QStringLiteral("You should stop taking metformin."));
        QCOMPARE(v.size(), 1);
        QCOMPARE(v[0].category, ViolationCategory::PrescriptiveLanguage);
        QCOMPARE(v[0].length, qsizetype(15));
    }

    void testAlarm() {
        KeywordScanner scanner(m_registry);
        const auto v = scanner.scan(QStringLiteral("This is dangerous."));
        QCOMPARE(v.size(), 1);
        QCOMPARE(v[0].category, ViolationCategory::AlarmLanguage);
        QCOMPARE(v[0].offset, qsizetype(8));
        QCOMPARE(v[0].length, qsizetype(9));
    }

    void testCaseInsensitive() {
        KeywordScanner scanner(m_registry);
        QCOMPARE(scanner.scan(QStringLiteral("THIS IS DANGEROUS")).size(), 1);
    }

    void testWordBoundary() {
        KeywordScanner scanner(m_registry);
        QVERIFY(scanner.scan(QStringLiteral("The report covers nondangerousness metrics.")).isEmpty());
    }

    void testCleanText() {
        KeywordScanner scanner(m_registry);
        QVERIFY(scanner.scan(QStringLiteral("Your documents show an HbA1c of 7.2%.")).isEmpty());
        QVERIFY(scanner.scan(QString()).isEmpty());
    }

    void testContainedMatchesDropped() {
        KeywordScanner scanner(m_registry);
        const auto v = scanner.scan(QStringLiteral("Go to the emergency room immediately."));
        QCOMPARE(v.size(), 2);
        QCOMPARE(v[0].offset, qsizetype(0));
        QCOMPARE(v[0].length, qsizetype(19));
        QCOMPARE(v[1].offset, qsizetype(25));
    }

    void testDeduplicate() {
        ViolationList list = {span(5, 3), span(0, 10), span(12, 2), span(12, 4)};
        KeywordScanner::deduplicate(list);
        QCOMPARE(list.size(), 2);
        QCOMPARE(list[0].offset, qsizetype(0));
        QCOMPARE(list[0].length, qsizetype(10));
        QCOMPARE(list[1].offset, qsizetype(12));
        QCOMPARE(list[1].length, qsizetype(4));
    }

    void testDeduplicateKeepsPartialOverlap() {
        ViolationList list = {span(3, 5), span(0, 5)};
        KeywordScanner::deduplicate(list);
        QCOMPARE(list.size(), 2);
        QCOMPARE(list[0].offset, qsizetype(0));
        QCOMPARE(list[1].offset, qsizetype(3));
    }

    void testNoKeptMatchContainsAnother() {
        KeywordScanner scanner(m_registry);
        const auto v = scanner.scan(QStringLiteral(
            "Call 911 immediately. This could be a medical emergency, do not wait."));
        QVERIFY(!v.isEmpty());
        for (int i = 0; i < v.size(); ++i) {
            for (int j = 0; j < v.size(); ++j) {
                if (i != j)
                    QVERIFY(!v[i].contains(v[j]));
            }
        }
    }
};

QTEST_MAIN(TestKeywordScanner)
#include "tst_keyword_scanner.moc"
