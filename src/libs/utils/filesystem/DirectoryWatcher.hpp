// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QStringList>
#include <QtCore/QTimer>

QT_BEGIN_NAMESPACE
class QFileSystemWatcher;
QT_END_NAMESPACE

namespace Utils {

// Watches a directory and its subdirectories down to a fixed depth and
// reports coalesced changes. The watch set is rebuilt off the UI thread.
class UTILS_EXPORT DirectoryWatcher final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString rootPath READ rootPath WRITE setRootPath NOTIFY rootPathChanged)
    Q_PROPERTY(int maxDepth READ maxDepth WRITE setMaxDepth)
    Q_PROPERTY(int debounceMs READ debounceMs WRITE setDebounceMs)

public:
    explicit DirectoryWatcher(QObject* parent = nullptr);

    QString rootPath() const;
    void setRootPath(const QString& root);

    int maxDepth() const;
    void setMaxDepth(int depth);

    int debounceMs() const;
    void setDebounceMs(int ms);

    QSet<QString> watchedDirectories() const;

signals:
    void rootPathChanged(const QString& root);
    void directoriesChanged(const QStringList& paths);
    void watchSetUpdated(int directoryCount);

private slots:
    void handleDirectoryChanged(const QString& path);
    void flushChanges();
    void performRescan();

private:
    void scheduleRescan();
    void applyWatchSet(const QSet<QString>& directories);

    static QSet<QString> collectDirectories(const QString& root, int maxDepth);
    static void collectDirectory(const QString& dirPath, int depthLeft, QSet<QString>& out);

    QString m_rootPath;
    QPointer<QFileSystemWatcher> m_watcher;
    QSet<QString> m_watchedDirs;
    QSet<QString> m_pendingChanges;
    QTimer m_flushTimer;

    int m_maxDepth = 3;
    quint64 m_generation = 0;
};

} // namespace Utils
