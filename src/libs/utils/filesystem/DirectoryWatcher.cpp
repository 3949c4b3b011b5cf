#include "utils/filesystem/DirectoryWatcher.hpp"

#include "utils/async/AsyncTask.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QFileSystemWatcher>

namespace Utils {

DirectoryWatcher::DirectoryWatcher(QObject* parent)
    : QObject(parent)
    , m_watcher(new QFileSystemWatcher(this))
{
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(300);
    connect(&m_flushTimer, &QTimer::timeout, this, &DirectoryWatcher::flushChanges);

    connect(m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &DirectoryWatcher::handleDirectoryChanged);
}

QString DirectoryWatcher::rootPath() const
{
    return m_rootPath;
}

void DirectoryWatcher::setRootPath(const QString& root)
{
    const QString cleaned = root.trimmed().isEmpty()
                                ? QString()
                                : QFileInfo(QDir::cleanPath(root)).absoluteFilePath();
    if (cleaned == m_rootPath)
        return;

    m_rootPath = cleaned;
    m_pendingChanges.clear();
    m_flushTimer.stop();
    emit rootPathChanged(m_rootPath);
    scheduleRescan();
}

int DirectoryWatcher::maxDepth() const
{
    return m_maxDepth;
}

void DirectoryWatcher::setMaxDepth(int depth)
{
    const int next = qMax(0, depth);
    if (next == m_maxDepth)
        return;
    m_maxDepth = next;
    scheduleRescan();
}

int DirectoryWatcher::debounceMs() const
{
    return m_flushTimer.interval();
}

void DirectoryWatcher::setDebounceMs(int ms)
{
    m_flushTimer.setInterval(qMax(0, ms));
}

QSet<QString> DirectoryWatcher::watchedDirectories() const
{
    return m_watchedDirs;
}

void DirectoryWatcher::handleDirectoryChanged(const QString& path)
{
    m_pendingChanges.insert(path);
    m_flushTimer.start();
}

void DirectoryWatcher::flushChanges()
{
    QStringList changed = m_pendingChanges.values();
    m_pendingChanges.clear();
    if (changed.isEmpty())
        return;

    changed.sort();
    emit directoriesChanged(changed);

    // New or removed subdirectories change the watch set itself.
    scheduleRescan();
}

void DirectoryWatcher::scheduleRescan()
{
    QMetaObject::invokeMethod(this, &DirectoryWatcher::performRescan, Qt::QueuedConnection);
}

void DirectoryWatcher::performRescan()
{
    const QString root = m_rootPath;
    const int depth = m_maxDepth;
    const quint64 token = ++m_generation;

    if (root.isEmpty()) {
        applyWatchSet({});
        return;
    }

    Utils::Async::run<QSet<QString>>(this,
                                     [root, depth]() { return collectDirectories(root, depth); },
                                     [this, token](QSet<QString> dirs) {
                                         if (token != m_generation)
                                             return;
                                         applyWatchSet(dirs);
                                     });
}

void DirectoryWatcher::applyWatchSet(const QSet<QString>& directories)
{
    if (!m_watcher)
        return;

    QSet<QString> toRemove = m_watchedDirs;
    toRemove.subtract(directories);

    QSet<QString> toAdd = directories;
    toAdd.subtract(m_watchedDirs);

    if (!toRemove.isEmpty())
        m_watcher->removePaths(toRemove.values());

    if (!toAdd.isEmpty()) {
        const QStringList failed = m_watcher->addPaths(toAdd.values());
        for (const QString& path : failed) {
            qCDebug(utilslog) << "Cannot watch directory" << path;
            toAdd.remove(path);
        }
    }

    m_watchedDirs = (m_watchedDirs - toRemove) + toAdd;
    emit watchSetUpdated(int(m_watchedDirs.size()));
}

QSet<QString> DirectoryWatcher::collectDirectories(const QString& root, int maxDepth)
{
    QSet<QString> dirs;
    const QFileInfo rootInfo(root);
    if (!rootInfo.exists() || !rootInfo.isDir())
        return dirs;

    dirs.insert(rootInfo.absoluteFilePath());
    collectDirectory(rootInfo.absoluteFilePath(), maxDepth, dirs);
    return dirs;
}

void DirectoryWatcher::collectDirectory(const QString& dirPath, int depthLeft, QSet<QString>& out)
{
    if (depthLeft <= 0)
        return;

    const QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden);
    for (const QFileInfo& info : entries) {
        if (info.isSymLink())
            continue;
        out.insert(info.absoluteFilePath());
        collectDirectory(info.absoluteFilePath(), depthLeft - 1, out);
    }
}

} // namespace Utils
