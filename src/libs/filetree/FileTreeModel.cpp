// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filetree/FileTreeModel.hpp"

#include <QtGui/QBrush>
#include <QtGui/QFont>
#include <QtWidgets/QFileIconProvider>

namespace FileTree {

namespace {

const QFileIconProvider& iconProvider()
{
    static const QFileIconProvider provider;
    return provider;
}

} // namespace

FileTreeModel::FileTreeModel(QObject* parent)
    : QAbstractItemModel(parent)
{
}

void FileTreeModel::setTree(const Node& tree)
{
    beginResetModel();
    m_root = tree;
    m_parents.clear();
    m_pathIndex.clear();
    rebuildIndex(&m_root, nullptr);
    endResetModel();
}

const Node& FileTreeModel::tree() const
{
    return m_root;
}

QString FileTreeModel::rootPath() const
{
    return m_root.path;
}

void FileTreeModel::rebuildIndex(Node* node, Node* parent)
{
    m_parents.insert(node, parent);
    if (!node->path.isEmpty())
        m_pathIndex.insert(node->path, node);
    for (Node& child : node->children)
        rebuildIndex(&child, node);
}

QColor FileTreeModel::markerColor(Session::MarkerColor color)
{
    switch (color) {
    case Session::MarkerColor::Green: return QColor(0x28, 0xa7, 0x45);
    case Session::MarkerColor::Red:   return QColor(0xdc, 0x35, 0x45);
    case Session::MarkerColor::None:  break;
    }
    return {};
}

bool FileTreeModel::setMarker(const QString& path, Session::MarkerColor color)
{
    Node* node = m_pathIndex.value(path, nullptr);
    if (!node)
        return false;
    if (node->marker == color)
        return true;

    node->marker = color;
    const QModelIndex idx = indexForNode(node);
    if (idx.isValid())
        emit dataChanged(idx, idx, {MarkerRole, Qt::ForegroundRole, Qt::FontRole});
    return true;
}

QModelIndex FileTreeModel::indexForPath(const QString& path) const
{
    return indexForNode(m_pathIndex.value(path, nullptr));
}

const Node* FileTreeModel::nodeForIndex(const QModelIndex& index) const
{
    if (!index.isValid())
        return nullptr;
    return static_cast<const Node*>(index.internalPointer());
}

QModelIndex FileTreeModel::indexForNode(const Node* node) const
{
    if (!node || node == &m_root)
        return {};

    const Node* parent = m_parents.value(node, nullptr);
    if (!parent)
        return {};

    const qsizetype row = node - parent->children.constData();
    if (row < 0 || row >= parent->children.size())
        return {};
    return createIndex(int(row), 0, const_cast<Node*>(node));
}

int FileTreeModel::rowCount(const QModelIndex& parent) const
{
    if (parent.column() > 0)
        return 0;
    const Node* node = parent.isValid() ? nodeForIndex(parent) : &m_root;
    return node ? int(node->children.size()) : 0;
}

int FileTreeModel::columnCount(const QModelIndex& parent) const
{
    Q_UNUSED(parent);
    return 1;
}

QModelIndex FileTreeModel::index(int row, int column, const QModelIndex& parent) const
{
    if (column != 0 || row < 0)
        return {};

    const Node* parentNode = parent.isValid() ? nodeForIndex(parent) : &m_root;
    if (!parentNode || row >= parentNode->children.size())
        return {};
    return createIndex(row, 0, const_cast<Node*>(&parentNode->children[row]));
}

QModelIndex FileTreeModel::parent(const QModelIndex& index) const
{
    const Node* node = nodeForIndex(index);
    if (!node)
        return {};
    return indexForNode(m_parents.value(node, nullptr));
}

QVariant FileTreeModel::data(const QModelIndex& index, int role) const
{
    const Node* node = nodeForIndex(index);
    if (!node)
        return {};

    switch (role) {
    case Qt::DisplayRole:
        return node->name;
    case Qt::ToolTipRole:
        return node->error ? QStringLiteral("Cannot read this folder: %1").arg(node->path) : node->path;
    case Qt::DecorationRole:
        return iconProvider().icon(node->isDirectory ? QAbstractFileIconProvider::Folder
                                                     : QAbstractFileIconProvider::File);
    case Qt::ForegroundRole: {
        const QColor color = markerColor(node->marker);
        return color.isValid() ? QVariant(QBrush(color)) : QVariant();
    }
    case Qt::FontRole: {
        if (node->marker == Session::MarkerColor::None && !node->error)
            return {};
        QFont font;
        font.setBold(node->marker != Session::MarkerColor::None);
        font.setItalic(node->error);
        return font;
    }
    case PathRole:
        return node->path;
    case IsDirectoryRole:
        return node->isDirectory;
    case MarkerRole:
        return static_cast<int>(node->marker);
    case ErrorRole:
        return node->error;
    case ExpandedRole:
        return node->expanded;
    default:
        break;
    }
    return {};
}

Qt::ItemFlags FileTreeModel::flags(const QModelIndex& index) const
{
    if (!index.isValid())
        return Qt::NoItemFlags;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

} // namespace FileTree
