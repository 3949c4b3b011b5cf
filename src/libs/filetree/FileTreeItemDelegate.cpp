#include "filetree/FileTreeItemDelegate.hpp"

#include "filetree/FileTreeModel.hpp"

#include <QtWidgets/QStyle>

namespace FileTree {

FileTreeItemDelegate::FileTreeItemDelegate(QObject* parent)
    : QStyledItemDelegate(parent)
{
}

void FileTreeItemDelegate::initStyleOption(QStyleOptionViewItem* option, const QModelIndex& index) const
{
    QStyledItemDelegate::initStyleOption(option, index);

    const bool selected = option->state & QStyle::State_Selected;
    const auto marker = static_cast<Session::MarkerColor>(index.data(FileTreeModel::MarkerRole).toInt());

    if (marker != Session::MarkerColor::None) {
        const QBrush text = selected ? option->palette.brush(QPalette::HighlightedText)
                                     : QBrush(FileTreeModel::markerColor(marker));
        option->palette.setBrush(QPalette::Text, text);
        return;
    }

    if (index.data(FileTreeModel::ErrorRole).toBool() && !selected)
        option->palette.setBrush(QPalette::Text, option->palette.brush(QPalette::Disabled, QPalette::Text));
}

} // namespace FileTree
