// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"
#include "filetree/FileTreeTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Session {
class SessionState;
}

namespace Utils {
class DirectoryWatcher;
}

namespace FileTree {

// Owns the tree root and filter. Scans run on the thread pool; results
// that arrive after a newer refresh are dropped. A clean scan prunes
// stale session entries under the root before the tree is published.
class FILETREE_EXPORT FileTreeDataSource final : public QObject
{
    Q_OBJECT

public:
    explicit FileTreeDataSource(Session::SessionState& session, QObject* parent = nullptr);

    QString rootPath() const;
    void setRootPath(const QString& path);

    QStringList extensions() const;
    void setExtensions(const QStringList& extensions);

    const Node& tree() const;

public slots:
    void refresh();

signals:
    void rootPathChanged(const QString& path);
    void treeChanged(const FileTree::Node& tree);
    void scanFinished(int errorCount);

private:
    void applyScan(const ScanResult& result);

    Session::SessionState& m_session;
    Utils::DirectoryWatcher* m_watcher = nullptr;
    QString m_rootPath;
    QStringList m_extensions;
    Node m_tree;
    quint64 m_scanGeneration = 0;
};

} // namespace FileTree
