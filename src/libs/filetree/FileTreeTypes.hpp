// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"

#include <session/ConfigurationRecord.hpp>

#include <QtCore/QMetaType>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QVector>

namespace FileTree {

struct Node final {
    QString path;       // absolute key
    QString name;
    bool isDirectory = false;
    Session::MarkerColor marker = Session::MarkerColor::None;
    bool expanded = false;
    bool error = false;
    QVector<Node> children;

    bool operator==(const Node&) const = default;
};

// Undecorated result of walking the filesystem. livePaths holds every
// entry that was enumerated, including files the filter hid. unwalked
// holds directories that were listed but not descended into.
struct ScanResult final {
    Node tree;
    QSet<QString> livePaths;
    QSet<QString> unwalked;
    int errorCount = 0;
};

} // namespace FileTree

Q_DECLARE_METATYPE(FileTree::Node)
