// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeActions.hpp"
#include "filetree/FileTreeGlobal.hpp"
#include "filetree/FileTreeTypes.hpp"

#include <utils/Result.hpp>

#include <QtWidgets/QWidget>

class QTreeView;
class QModelIndex;
class QPoint;

namespace Session {
class SessionState;
}

namespace FileTree {

class FileOperations;
class FileTreeDataSource;
class FileTreeModel;

class FILETREE_EXPORT FileTreePanel final : public QWidget
{
    Q_OBJECT

public:
    FileTreePanel(Session::SessionState& session, FileTreeDataSource* dataSource, QWidget* parent = nullptr);

    QTreeView* view() const { return m_tree; }
    FileTreeModel* model() const { return m_model; }
    FileOperations* operations() const { return m_operations; }

    // Expands the parents of path and makes it current once it is shown.
    void selectPath(const QString& path);

    // Runs a context action against path as if picked from the menu.
    // Prompts (names, delete confirmation) are shown as dialogs.
    void triggerAction(FileTreeActions::Action action, const QString& path, bool isDirectory);

signals:
    void fileActivated(const QString& path);
    void revealRequested(const QString& path);

private slots:
    void handleTreeChanged(const FileTree::Node& tree);
    void handleActivate(const QModelIndex& index);
    void handleExpanded(const QModelIndex& index);
    void handleCollapsed(const QModelIndex& index);
    void handleMarkerChanged(const QString& path, Session::MarkerColor color);
    void showContextMenu(const QPoint& pos);

private:
    void restoreExpansion(const QModelIndex& parent);
    void reportFailure(const QString& title, const Utils::Result& result);
    QString targetDirectory(const QString& path, bool isDirectory) const;

    Session::SessionState& m_session;
    FileTreeDataSource* m_dataSource = nullptr;
    FileTreeModel* m_model = nullptr;
    FileOperations* m_operations = nullptr;
    QTreeView* m_tree = nullptr;
    QString m_pendingSelection;
    bool m_restoring = false;
};

} // namespace FileTree
