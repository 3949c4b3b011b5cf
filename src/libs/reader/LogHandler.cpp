// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/LogHandler.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QStandardPaths>
#include <QtCore/QTextStream>

#include <cstdio>

namespace Reader {

namespace {

struct LogSink {
    QMutex mutex;
    QFile file;
    QString dir;
    QDate openedFor;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

LogSink& sink()
{
    static LogSink s;
    return s;
}

const char* levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARNING";
    case QtCriticalMsg: return "CRITICAL";
    case QtFatalMsg:    return "FATAL";
    }
    return "DEBUG";
}

// Caller holds the sink mutex.
bool openForDate(LogSink& s, const QDate& date)
{
    if (s.file.isOpen() && s.openedFor == date)
        return true;

    s.file.close();
    s.file.setFileName(logFilePath(s.dir, date));
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        return false;
    s.openedFor = date;
    return true;
}

void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    if (isSuppressedLogMessage(message))
        return;

    const QDateTime now = QDateTime::currentDateTime();
    const QString line = formatLogLine(type, context.category, message, now);

    LogSink& s = sink();
    {
        QMutexLocker lock(&s.mutex);
        if (openForDate(s, now.date())) {
            s.file.write(line.toUtf8());
            s.file.write("\n");
            s.file.flush();
        }
    }

    const QByteArray local = line.toLocal8Bit();
    std::fprintf(stderr, "%s\n", local.constData());
    std::fflush(stderr);
}

} // namespace

QString logFilePath(const QString& logDir, const QDate& date)
{
    return QDir(logDir).filePath(QStringLiteral("mdreader_%1.log").arg(date.toString(QStringLiteral("yyyyMMdd"))));
}

QString formatLogLine(QtMsgType type, const char* category, const QString& message, const QDateTime& when)
{
    const QString cat = (category && *category) ? QString::fromLatin1(category) : QStringLiteral("default");
    return QStringLiteral("%1 - %2 - %3 - %4")
        .arg(when.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")), cat,
             QString::fromLatin1(levelName(type)), message);
}

bool isSuppressedLogMessage(const QString& message)
{
    return message.contains(QStringLiteral("DirectWrite"))
           || message.contains(QStringLiteral("CreateFontFaceFromHDC"));
}

Utils::Result installLogHandler(const QString& logDir)
{
    QString dir = logDir;
    if (dir.isEmpty()) {
        const QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
        if (base.isEmpty())
            return Utils::Result::failure(QStringLiteral("No writable application data location."));
        dir = QDir(base).filePath(QStringLiteral("logs"));
    }

    if (!QDir().mkpath(dir))
        return Utils::Result::failure(QStringLiteral("Cannot create log directory: %1").arg(dir));

    LogSink& s = sink();
    {
        QMutexLocker lock(&s.mutex);
        s.file.close();
        s.dir = dir;
        s.openedFor = {};
        if (!openForDate(s, QDate::currentDate()))
            return Utils::Result::failure(QStringLiteral("Cannot open log file: %1").arg(s.file.fileName()));
    }

    if (!s.installed) {
        s.previous = qInstallMessageHandler(handleMessage);
        s.installed = true;
    }
    return Utils::Result::success();
}

void uninstallLogHandler()
{
    LogSink& s = sink();
    if (s.installed) {
        qInstallMessageHandler(s.previous);
        s.previous = nullptr;
        s.installed = false;
    }

    QMutexLocker lock(&s.mutex);
    s.file.close();
    s.openedFor = {};
}

} // namespace Reader
