#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include "config/config_store.h"
#include "config/config_types.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private:
    static void writeJson(const QString& path, const QJsonObject& root) {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(QJsonDocument(root).toJson());
    }

private slots:
    void testLoadMissingKeepsDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        ConfigStore store;
        QVERIFY(!store.load(path));

        const SafetyConfig c = store.safetyConfig();
        QCOMPARE(c.input.maxLength, 2000);
        QCOMPARE(c.input.redactionMarker, QStringLiteral("[FILTERED]"));
        QCOMPARE(c.filter.maxRephraseViolations, 3);
        QCOMPARE(c.filter.maxBoundaryRegenerations, 2);
        QVERIFY(c.filter.appendTruncationDisclaimer);
        QVERIFY(!c.runtime.debugMode);
        QVERIFY(c.isValid());
    }

    void testSaveAndReload() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        {
            ConfigStore store;
            store.load(path);
            QVariantMap filter;
            filter[QStringLiteral("max_rephrase_violations")] = 5;
            filter[QStringLiteral("appendTruncationDisclaimer")] = false;
            store.setFilterSettings(filter);
            QVariantMap input;
            input[QStringLiteral("maxLength")] = 500;
            input[QStringLiteral("redaction_marker")] = QStringLiteral("<x>");
            store.setInputOptions(input);
        }

        ConfigStore reloaded;
        QVERIFY(reloaded.load(path));
        const SafetyConfig c = reloaded.safetyConfig();
        QCOMPARE(c.filter.maxRephraseViolations, 5);
        QVERIFY(!c.filter.appendTruncationDisclaimer);
        QCOMPARE(c.input.maxLength, 500);
        QCOMPARE(c.input.redactionMarker, QStringLiteral("<x>"));
        QCOMPARE(c.filter.maxBoundaryRegenerations, 2);
    }

    void testCamelCaseKeys() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        QJsonObject filter;
        filter[QStringLiteral("maxBoundaryRegenerations")] = 4;
        QJsonObject runtime;
        runtime[QStringLiteral("debugMode")] = true;
        runtime[QStringLiteral("logDir")] = QStringLiteral("/tmp/medguard-logs");
        QJsonObject root;
        root[QStringLiteral("filter")] = filter;
        root[QStringLiteral("runtime")] = runtime;
        writeJson(path, root);

        ConfigStore store;
        QVERIFY(store.load(path));
        QCOMPARE(store.safetyConfig().filter.maxBoundaryRegenerations, 4);
        QVERIFY(store.runtimeConfig().debugMode);
        QCOMPARE(store.runtimeConfig().logDir, QStringLiteral("/tmp/medguard-logs"));
    }

    void testValuesAreClamped() {
        QJsonObject input;
        input[QStringLiteral("max_length")] = -5;
        input[QStringLiteral("redaction_marker")] = QString();
        QJsonObject filter;
        filter[QStringLiteral("max_boundary_regenerations")] = 99;
        filter[QStringLiteral("max_rephrase_violations")] = -1;
        QJsonObject root;
        root[QStringLiteral("input")] = input;
        root[QStringLiteral("filter")] = filter;

        const SafetyConfig c = ConfigStore::fromJson(root);
        QCOMPARE(c.input.maxLength, 1);
        QCOMPARE(c.input.redactionMarker, QStringLiteral("[FILTERED]"));
        QCOMPARE(c.filter.maxBoundaryRegenerations, 10);
        QCOMPARE(c.filter.maxRephraseViolations, 0);
        QVERIFY(c.isValid());
    }

    void testInvalidJsonRejected() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ not json");
        file.close();

        ConfigStore store;
        QVERIFY(!store.load(path));
        QCOMPARE(store.safetyConfig().filter.maxRephraseViolations, 3);
    }

    void testConfigChangedSignal() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        ConfigStore store;
        store.load(dir.path() + QStringLiteral("/config.json"));

        QSignalSpy spy(&store, &ConfigStore::configChanged);
        QVariantMap runtime;
        runtime[QStringLiteral("debug_mode")] = true;
        store.setRuntimeOptions(runtime);
        QCOMPARE(spy.count(), 1);
        QVERIFY(store.runtimeOptions().value(QStringLiteral("debugMode")).toBool());
    }

    void testRuntimeOverrideNotPersisted() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        ConfigStore store;
        store.load(path);
        QVariantMap runtime;
        runtime[QStringLiteral("log_dir")] = dir.path();
        store.setRuntimeOptions(runtime, false);

        QCOMPARE(store.runtimeConfig().logDir, dir.path());
        QVERIFY(!QFile::exists(path));
    }

    void testJsonRoundTrip() {
        SafetyConfig c;
        c.input.maxLength = 123;
        c.filter.maxBoundaryRegenerations = 0;
        c.runtime.debugMode = true;
        const SafetyConfig back = ConfigStore::fromJson(ConfigStore::toJson(c));
        QCOMPARE(back.input.maxLength, 123);
        QCOMPARE(back.filter.maxBoundaryRegenerations, 0);
        QVERIFY(back.runtime.debugMode);
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
