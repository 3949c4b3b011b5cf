// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"
#include "filetree/FileTreeTypes.hpp"

#include <QtCore/QAbstractItemModel>
#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtGui/QColor>

namespace FileTree {

// Item model over a projected tree. The root folder itself is not a row;
// its children are the top-level items.
class FILETREE_EXPORT FileTreeModel final : public QAbstractItemModel
{
    Q_OBJECT

public:
    enum Role {
        PathRole = Qt::UserRole + 1,
        IsDirectoryRole,
        MarkerRole,
        ErrorRole,
        ExpandedRole
    };

    explicit FileTreeModel(QObject* parent = nullptr);

    void setTree(const Node& tree);
    const Node& tree() const;
    QString rootPath() const;

    // Updates one row in place; returns false if the path is not shown.
    bool setMarker(const QString& path, Session::MarkerColor color);

    QModelIndex indexForPath(const QString& path) const;
    const Node* nodeForIndex(const QModelIndex& index) const;

    static QColor markerColor(Session::MarkerColor color);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QModelIndex index(int row, int column, const QModelIndex& parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex& index) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;

private:
    void rebuildIndex(Node* node, Node* parent);
    QModelIndex indexForNode(const Node* node) const;

    Node m_root;
    QHash<const Node*, Node*> m_parents;
    QHash<QString, Node*> m_pathIndex;
};

} // namespace FileTree
