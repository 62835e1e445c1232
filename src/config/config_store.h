#pragma once
#include "config_types.h"
#include <QJsonObject>
#include <QObject>
#include <QVariantMap>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // Missing file: returns false and keeps defaults. Empty path selects
    // config.json under the app data location.
    bool load(const QString& path);
    bool save();
    QString filePath() const { return m_filePath; }

    QVariantMap inputOptions() const;
    void setInputOptions(const QVariantMap& opts);
    QVariantMap filterSettings() const;
    void setFilterSettings(const QVariantMap& opts);
    QVariantMap runtimeOptions() const;
    void setRuntimeOptions(const QVariantMap& opts, bool persist = true);

    SafetyConfig safetyConfig() const { return m_config; }
    RuntimeOptions runtimeConfig() const { return m_config.runtime; }

    static SafetyConfig fromJson(const QJsonObject& root);
    static QJsonObject toJson(const SafetyConfig& config);

signals:
    void configChanged();

private:
    SafetyConfig m_config;
    QString m_filePath;
};
