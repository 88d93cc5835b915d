#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>

#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, &LogManager::flushPending);
}

LogManager::~LogManager() {
    closeFile();
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

bool LogManager::setLogFilePath(const QString& path) {
    closeFile();
    if (path.isEmpty()) return true;

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "[LogManager] cannot open log file %s\n", path.toLocal8Bit().constData());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start " << QDateTime::currentDateTime().toString(Qt::ISODate) << " ---\n";
    m_ts.flush();
    return true;
}

void LogManager::closeFile() {
    flushPending();
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        while (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }
    } // unlock before emitting

    emit logsChanged();
    emit logAdded(logEntry);

    if (m_ts.device()) {
        m_ts << logEntry << '\n';
        scheduleFlush(level);
    }
}

void LogManager::flushPending() {
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
    if (m_flushTimer.isActive()) {
        m_flushTimer.stop();
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::scheduleFlush(const QString& level) {
    m_pendingFlush = true;

    if (shouldFlushImmediately(level)) {
        flushPending();
        return;
    }

    if (!m_flushTimer.isActive())
        m_flushTimer.start();
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    // Queued so a message emitted from inside a slot connected to logAdded cannot recurse
    QMetaObject::invokeMethod(&LogManager::instance(), [level, msg]() {
        LogManager::instance().addLog(msg, level);
    }, Qt::QueuedConnection);

    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    fprintf(stderr, "[%s] [%s] %s\n",
            timestamp.toLocal8Bit().constData(),
            level.toLocal8Bit().constData(),
            msg.toLocal8Bit().constData());
    fflush(stderr);

    if (type == QtFatalMsg) {
        abort();
    }
}
