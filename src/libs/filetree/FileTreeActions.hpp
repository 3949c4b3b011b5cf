// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"

#include <session/ConfigurationRecord.hpp>

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringView>

#include <optional>

namespace FileTree {

class FILETREE_EXPORT FileTreeActions final
{
    Q_GADGET

public:
    enum class Action {
        MarkGreen,
        MarkRed,
        ClearMark,
        Reveal,
        NewFolder,
        NewMarkdownFile,
        Rename,
        Delete
    };
    Q_ENUM(Action)

    static QString id(Action action);
    static std::optional<Action> fromId(QStringView id);
    static QString text(Action action);

    // Actions in one group are shown together, groups split by separators.
    static int group(Action action);

    // Context-menu contents for a row, in display order. A file offers only
    // the marker actions that would change its current marker.
    static QList<Action> available(bool isDirectory, Session::MarkerColor marker);
    // Contents when the click lands on empty space below the rows.
    static QList<Action> availableForRoot();
};

} // namespace FileTree
