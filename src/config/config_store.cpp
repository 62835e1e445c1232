#include "config_store.h"
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QDir>

namespace {

constexpr int kMaxInputLength = 100000;
constexpr int kMaxRephraseViolations = 50;
constexpr int kMaxBoundaryRegenerations = 10;

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

bool mapContainsEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    return map.contains(QString::fromUtf8(snakeKey)) || map.contains(QString::fromUtf8(camelKey));
}

QVariant mapValueEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (map.contains(snake))
        return map.value(snake);
    return map.value(QString::fromUtf8(camelKey));
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

SafetyConfig ConfigStore::fromJson(const QJsonObject& root) {
    SafetyConfig c;

    // input
    const QJsonObject in = root["input"].toObject();
    c.input.maxLength = clampInt(jsonIntEither(in, "max_length", "maxLength", c.input.maxLength),
                                 1, kMaxInputLength);
    c.input.redactionMarker = jsonStringEither(in, "redaction_marker", "redactionMarker",
                                               c.input.redactionMarker);
    if (c.input.redactionMarker.isEmpty())
        c.input.redactionMarker = InputOptions().redactionMarker;

    // filter
    const QJsonObject f = root["filter"].toObject();
    c.filter.maxRephraseViolations = clampInt(
        jsonIntEither(f, "max_rephrase_violations", "maxRephraseViolations", c.filter.maxRephraseViolations),
        0, kMaxRephraseViolations);
    c.filter.maxBoundaryRegenerations = clampInt(
        jsonIntEither(f, "max_boundary_regenerations", "maxBoundaryRegenerations", c.filter.maxBoundaryRegenerations),
        0, kMaxBoundaryRegenerations);
    c.filter.appendTruncationDisclaimer = jsonBoolEither(
        f, "append_truncation_disclaimer", "appendTruncationDisclaimer", c.filter.appendTruncationDisclaimer);

    // runtime
    const QJsonObject rt = root["runtime"].toObject();
    c.runtime.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", false);
    c.runtime.logDir = jsonStringEither(rt, "log_dir", "logDir", QString());
    return c;
}

QJsonObject ConfigStore::toJson(const SafetyConfig& c) {
    QJsonObject root;
    root["version"] = 1;

    QJsonObject in;
    in["max_length"] = c.input.maxLength;
    in["redaction_marker"] = c.input.redactionMarker;
    root["input"] = in;

    QJsonObject f;
    f["max_rephrase_violations"] = c.filter.maxRephraseViolations;
    f["max_boundary_regenerations"] = c.filter.maxBoundaryRegenerations;
    f["append_truncation_disclaimer"] = c.filter.appendTruncationDisclaimer;
    root["filter"] = f;

    QJsonObject rt;
    rt["debug_mode"] = c.runtime.debugMode;
    rt["log_dir"] = c.runtime.logDir;
    root["runtime"] = rt;
    return root;
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    if (m_filePath.isEmpty()) {
        QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(appData);
        m_filePath = appData + "/config.json";
    }
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly))
        return false;

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject())
        return false;

    m_config = fromJson(doc.object());
    emit configChanged();
    return true;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write(QJsonDocument(toJson(m_config)).toJson(QJsonDocument::Indented));
    return true;
}

QVariantMap ConfigStore::inputOptions() const {
    QVariantMap map;
    map["max_length"] = m_config.input.maxLength;
    map["maxLength"] = m_config.input.maxLength;
    map["redaction_marker"] = m_config.input.redactionMarker;
    map["redactionMarker"] = m_config.input.redactionMarker;
    return map;
}

void ConfigStore::setInputOptions(const QVariantMap& opts) {
    if (mapContainsEither(opts, "max_length", "maxLength"))
        m_config.input.maxLength = clampInt(mapValueEither(opts, "max_length", "maxLength").toInt(),
                                            1, kMaxInputLength);
    if (mapContainsEither(opts, "redaction_marker", "redactionMarker")) {
        const QString marker = mapValueEither(opts, "redaction_marker", "redactionMarker").toString();
        if (!marker.isEmpty())
            m_config.input.redactionMarker = marker;
    }
    save();
    emit configChanged();
}

QVariantMap ConfigStore::filterSettings() const {
    QVariantMap map;
    map["max_rephrase_violations"] = m_config.filter.maxRephraseViolations;
    map["maxRephraseViolations"] = m_config.filter.maxRephraseViolations;
    map["max_boundary_regenerations"] = m_config.filter.maxBoundaryRegenerations;
    map["maxBoundaryRegenerations"] = m_config.filter.maxBoundaryRegenerations;
    map["append_truncation_disclaimer"] = m_config.filter.appendTruncationDisclaimer;
    map["appendTruncationDisclaimer"] = m_config.filter.appendTruncationDisclaimer;
    return map;
}

void ConfigStore::setFilterSettings(const QVariantMap& opts) {
    if (mapContainsEither(opts, "max_rephrase_violations", "maxRephraseViolations"))
        m_config.filter.maxRephraseViolations = clampInt(
            mapValueEither(opts, "max_rephrase_violations", "maxRephraseViolations").toInt(),
            0, kMaxRephraseViolations);
    if (mapContainsEither(opts, "max_boundary_regenerations", "maxBoundaryRegenerations"))
        m_config.filter.maxBoundaryRegenerations = clampInt(
            mapValueEither(opts, "max_boundary_regenerations", "maxBoundaryRegenerations").toInt(),
            0, kMaxBoundaryRegenerations);
    if (mapContainsEither(opts, "append_truncation_disclaimer", "appendTruncationDisclaimer"))
        m_config.filter.appendTruncationDisclaimer =
            mapValueEither(opts, "append_truncation_disclaimer", "appendTruncationDisclaimer").toBool();
    save();
    emit configChanged();
}

QVariantMap ConfigStore::runtimeOptions() const {
    QVariantMap map;
    map["debug_mode"] = m_config.runtime.debugMode;
    map["debugMode"] = m_config.runtime.debugMode;
    map["log_dir"] = m_config.runtime.logDir;
    map["logDir"] = m_config.runtime.logDir;
    return map;
}

void ConfigStore::setRuntimeOptions(const QVariantMap& opts, bool persist) {
    if (mapContainsEither(opts, "debug_mode", "debugMode"))
        m_config.runtime.debugMode = mapValueEither(opts, "debug_mode", "debugMode").toBool();
    if (mapContainsEither(opts, "log_dir", "logDir"))
        m_config.runtime.logDir = mapValueEither(opts, "log_dir", "logDir").toString();
    if (persist)
        save();
    emit configChanged();
}
