// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filetree/FileTreePanel.hpp"

#include "filetree/FileOperations.hpp"
#include "filetree/FileTreeDataSource.hpp"
#include "filetree/FileTreeItemDelegate.hpp"
#include "filetree/FileTreeModel.hpp"

#include <session/SessionState.hpp>
#include <utils/PathUtils.hpp>

#include <QtGui/QAction>
#include <QtWidgets/QAbstractItemView>
#include <QtWidgets/QInputDialog>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QMenu>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QTreeView>
#include <QtWidgets/QVBoxLayout>

namespace FileTree {

FileTreePanel::FileTreePanel(Session::SessionState& session, FileTreeDataSource* dataSource, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
    , m_dataSource(dataSource)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_model = new FileTreeModel(this);
    m_operations = new FileOperations(m_session, this);

    m_tree = new QTreeView(this);
    m_tree->setObjectName(QStringLiteral("FileTree"));
    m_tree->setHeaderHidden(true);
    m_tree->setModel(m_model);
    m_tree->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tree->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tree->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tree->setContextMenuPolicy(Qt::CustomContextMenu);
    m_tree->setUniformRowHeights(true);
    m_tree->setItemDelegate(new FileTreeItemDelegate(m_tree));
    layout->addWidget(m_tree, 1);

    connect(m_tree, &QTreeView::activated, this, &FileTreePanel::handleActivate);
    connect(m_tree, &QTreeView::expanded, this, &FileTreePanel::handleExpanded);
    connect(m_tree, &QTreeView::collapsed, this, &FileTreePanel::handleCollapsed);
    connect(m_tree, &QTreeView::customContextMenuRequested, this, &FileTreePanel::showContextMenu);

    connect(&m_session, &Session::SessionState::markerChanged, this, &FileTreePanel::handleMarkerChanged);

    if (m_dataSource) {
        connect(m_dataSource, &FileTreeDataSource::treeChanged, this, &FileTreePanel::handleTreeChanged);
        connect(m_operations, &FileOperations::refreshRequested, m_dataSource, &FileTreeDataSource::refresh);
        if (!m_dataSource->tree().path.isEmpty())
            handleTreeChanged(m_dataSource->tree());
    }
}

void FileTreePanel::handleTreeChanged(const Node& tree)
{
    QString current = m_pendingSelection;
    if (current.isEmpty())
        current = m_tree->currentIndex().data(FileTreeModel::PathRole).toString();

    m_restoring = true;
    m_model->setTree(tree);
    restoreExpansion(QModelIndex());
    m_restoring = false;

    if (!current.isEmpty())
        selectPath(current);
}

void FileTreePanel::restoreExpansion(const QModelIndex& parent)
{
    const int rows = m_model->rowCount(parent);
    for (int r = 0; r < rows; ++r) {
        const QModelIndex child = m_model->index(r, 0, parent);
        if (!child.data(FileTreeModel::ExpandedRole).toBool())
            continue;
        m_tree->setExpanded(child, true);
        restoreExpansion(child);
    }
}

void FileTreePanel::selectPath(const QString& path)
{
    const QString key = Utils::PathUtils::absoluteKey(path);
    const QModelIndex index = m_model->indexForPath(key);
    if (!index.isValid()) {
        m_pendingSelection = key;
        return;
    }
    m_pendingSelection.clear();

    QModelIndex parent = index.parent();
    while (parent.isValid()) {
        m_tree->setExpanded(parent, true);
        parent = parent.parent();
    }

    m_tree->setCurrentIndex(index);
    m_tree->scrollTo(index);
}

void FileTreePanel::handleActivate(const QModelIndex& index)
{
    if (!index.isValid())
        return;

    if (index.data(FileTreeModel::IsDirectoryRole).toBool()) {
        m_tree->setExpanded(index, !m_tree->isExpanded(index));
        return;
    }

    emit fileActivated(index.data(FileTreeModel::PathRole).toString());
}

void FileTreePanel::handleExpanded(const QModelIndex& index)
{
    if (!m_restoring)
        m_session.setExpanded(index.data(FileTreeModel::PathRole).toString(), true);
}

void FileTreePanel::handleCollapsed(const QModelIndex& index)
{
    if (!m_restoring)
        m_session.setExpanded(index.data(FileTreeModel::PathRole).toString(), false);
}

void FileTreePanel::handleMarkerChanged(const QString& path, Session::MarkerColor color)
{
    m_model->setMarker(path, color);
}

void FileTreePanel::showContextMenu(const QPoint& pos)
{
    const QModelIndex index = m_tree->indexAt(pos);

    QString path = m_model->rootPath();
    bool isDirectory = true;
    QList<FileTreeActions::Action> actions = FileTreeActions::availableForRoot();
    if (index.isValid()) {
        path = index.data(FileTreeModel::PathRole).toString();
        isDirectory = index.data(FileTreeModel::IsDirectoryRole).toBool();
        const auto marker = static_cast<Session::MarkerColor>(index.data(FileTreeModel::MarkerRole).toInt());
        actions = FileTreeActions::available(isDirectory, marker);
    }
    if (path.isEmpty())
        return;

    QMenu menu(this);
    int lastGroup = -1;
    for (const FileTreeActions::Action action : std::as_const(actions)) {
        const int group = FileTreeActions::group(action);
        if (lastGroup >= 0 && group != lastGroup)
            menu.addSeparator();
        lastGroup = group;

        QAction* item = menu.addAction(FileTreeActions::text(action));
        item->setData(FileTreeActions::id(action));
    }

    QAction* chosen = menu.exec(m_tree->viewport()->mapToGlobal(pos));
    if (!chosen)
        return;

    const auto action = FileTreeActions::fromId(chosen->data().toString());
    if (action)
        triggerAction(*action, path, isDirectory);
}

QString FileTreePanel::targetDirectory(const QString& path, bool isDirectory) const
{
    return isDirectory ? path : Utils::PathUtils::parentPath(path);
}

void FileTreePanel::reportFailure(const QString& title, const Utils::Result& result)
{
    if (!result)
        QMessageBox::warning(this, title, result.message());
}

void FileTreePanel::triggerAction(FileTreeActions::Action action, const QString& path, bool isDirectory)
{
    using Action = FileTreeActions::Action;

    switch (action) {
    case Action::MarkGreen:
        m_session.setMarker(path, Session::MarkerColor::Green);
        return;
    case Action::MarkRed:
        m_session.setMarker(path, Session::MarkerColor::Red);
        return;
    case Action::ClearMark:
        m_session.clearMarker(path);
        return;
    case Action::Reveal:
        emit revealRequested(path);
        return;
    case Action::NewFolder: {
        bool ok = false;
        const QString name = QInputDialog::getText(this, QStringLiteral("New Folder"),
                                                   QStringLiteral("Folder name:"), QLineEdit::Normal,
                                                   QString(), &ok);
        if (!ok || name.trimmed().isEmpty())
            return;
        QString created;
        const Utils::Result r = m_operations->createFolder(targetDirectory(path, isDirectory), name, &created);
        reportFailure(QStringLiteral("New Folder"), r);
        if (r)
            m_pendingSelection = created;
        return;
    }
    case Action::NewMarkdownFile: {
        bool ok = false;
        const QString name = QInputDialog::getText(this, QStringLiteral("New Markdown File"),
                                                   QStringLiteral("File name:"), QLineEdit::Normal,
                                                   QString(), &ok);
        if (!ok || name.trimmed().isEmpty())
            return;
        QString created;
        const Utils::Result r = m_operations->createMarkdownFile(targetDirectory(path, isDirectory), name, &created);
        reportFailure(QStringLiteral("New Markdown File"), r);
        if (r)
            m_pendingSelection = created;
        return;
    }
    case Action::Rename: {
        bool ok = false;
        const QString oldName = Utils::PathUtils::basename(path);
        const QString name = QInputDialog::getText(this, QStringLiteral("Rename"), QStringLiteral("New name:"),
                                                   QLineEdit::Normal, oldName, &ok);
        if (!ok || name.trimmed().isEmpty() || name.trimmed() == oldName)
            return;
        QString renamed;
        const Utils::Result r = m_operations->renamePath(path, name, &renamed);
        reportFailure(QStringLiteral("Rename"), r);
        if (r)
            m_pendingSelection = renamed;
        return;
    }
    case Action::Delete: {
        const QString kind = isDirectory ? QStringLiteral("folder") : QStringLiteral("file");
        const auto answer = QMessageBox::question(
            this, QStringLiteral("Delete"),
            QStringLiteral("Delete the %1 \"%2\"?").arg(kind, Utils::PathUtils::basename(path)),
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes)
            return;
        reportFailure(QStringLiteral("Delete"), m_operations->removePath(path));
        return;
    }
    }
}

} // namespace FileTree
