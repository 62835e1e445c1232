#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>

namespace {
const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString nowStamp() {
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}
}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker lock(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return;

    QDir().mkpath(logDir);
    QString logPath = logDir + "/medguard.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::setMinimumLevel(int level) {
    QMutexLocker lock(&m_mutex);
    m_minimumLevel = qBound(static_cast<int>(Debug), level, static_cast<int>(Error));
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    const QString timestamp = nowStamp();
    {
        QMutexLocker lock(&m_mutex);
        if (level < m_minimumLevel)
            return;

        // file output
        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << QString("[%1] [%2] [%3] %4")
                          .arg(timestamp, kLevelNames[level], category, message)
                   << "\n";
            stream.flush();
        }

        // buffer for the CLI and tests
        QVariantMap entry;
        entry["level"] = static_cast<int>(level);
        entry["timestamp"] = timestamp;
        entry["category"] = category;
        entry["message"] = message;
        m_buffer.append(entry);
        while (m_buffer.size() > m_maxBuffer)
            m_buffer.removeFirst();
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker lock(&m_mutex);
    QVariantList result;
    int start = qMax(0, static_cast<int>(m_buffer.size()) - count);
    for (int i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker lock(&m_mutex);
    m_buffer.clear();
}
