// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"

#include <QtWidgets/QStyledItemDelegate>

namespace FileTree {

// Marker colours stay readable only on an unselected row; a selected row
// uses the palette's highlighted text instead.
class FILETREE_EXPORT FileTreeItemDelegate : public QStyledItemDelegate
{
    Q_OBJECT

public:
    explicit FileTreeItemDelegate(QObject* parent = nullptr);

protected:
    void initStyleOption(QStyleOptionViewItem* option, const QModelIndex& index) const override;
};

} // namespace FileTree
