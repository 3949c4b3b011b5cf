// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filetree/FileTreeDataSource.hpp"

#include "filetree/FileTreeProjection.hpp"

#include <session/SessionState.hpp>
#include <utils/PathUtils.hpp>
#include <utils/async/AsyncTask.hpp>
#include <utils/filesystem/DirectoryWatcher.hpp>

namespace FileTree {

FileTreeDataSource::FileTreeDataSource(Session::SessionState& session, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_extensions(FileTreeProjection::defaultExtensions())
{
    m_watcher = new Utils::DirectoryWatcher(this);
    connect(m_watcher, &Utils::DirectoryWatcher::directoriesChanged,
            this, [this](const QStringList&) { refresh(); });
}

QString FileTreeDataSource::rootPath() const
{
    return m_rootPath;
}

void FileTreeDataSource::setRootPath(const QString& path)
{
    const QString key = Utils::PathUtils::absoluteKey(path);
    if (key.isEmpty() || key == m_rootPath)
        return;

    m_rootPath = key;
    emit rootPathChanged(m_rootPath);
    m_watcher->setRootPath(m_rootPath);
    refresh();
}

QStringList FileTreeDataSource::extensions() const
{
    return m_extensions;
}

void FileTreeDataSource::setExtensions(const QStringList& extensions)
{
    QStringList next = Utils::PathUtils::normalizeExtensions(extensions);
    if (next.isEmpty())
        next = FileTreeProjection::defaultExtensions();
    if (next == m_extensions)
        return;

    m_extensions = next;
    refresh();
}

const Node& FileTreeDataSource::tree() const
{
    return m_tree;
}

void FileTreeDataSource::refresh()
{
    if (m_rootPath.isEmpty())
        return;

    const QString rootPath = m_rootPath;
    const QStringList extensions = m_extensions;
    const quint64 token = ++m_scanGeneration;

    Utils::Async::run<ScanResult>(this,
      [rootPath, extensions]() {
          return FileTreeProjection::scan(rootPath, extensions);
      },
      [this, token](ScanResult result) {
          if (token != m_scanGeneration)
              return;
          applyScan(result);
      });
}

void FileTreeDataSource::applyScan(const ScanResult& result)
{
    // A partial listing would make unreadable folders look empty and
    // prune everything recorded beneath them.
    if (result.errorCount == 0)
        m_session.reconcile(result.tree.path, result.livePaths, result.unwalked);
    else
        qCDebug(filetreelog) << "Scan of" << result.tree.path << "had" << result.errorCount
                             << "errors; skipping reconciliation.";

    m_tree = FileTreeProjection::decorate(result, m_session);
    emit scanFinished(result.errorCount);
    emit treeChanged(m_tree);
}

} // namespace FileTree
