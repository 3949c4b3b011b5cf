// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"
#include "filetree/FileTreeTypes.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Session {
class SessionState;
}

namespace FileTree {

// Builds the tree shown in the panel. scan() only touches the filesystem
// and may run on a worker thread; decorate() reads session state and
// belongs on the thread that owns the session.
class FILETREE_EXPORT FileTreeProjection final
{
public:
    static QStringList defaultExtensions();

    static ScanResult scan(const QString& rootPath, const QStringList& extensions);
    static Node decorate(const ScanResult& scanned, const Session::SessionState& session);
    static Node project(const QString& rootPath,
                        const QStringList& extensions,
                        const Session::SessionState& session);

    // Lists dir.path into dir.children and records what it saw in out.
    // A directory that cannot be listed is flagged and counted as an error.
    // Extensions must already be normalized.
    static void scanDirectory(Node& dir, const QStringList& extensions, ScanResult& out);

    // Directories first, then case-insensitive name, then exact name.
    static bool lessThan(const Node& a, const Node& b);

private:
    static void decorateNode(Node& node, const Session::SessionState& session);
};

} // namespace FileTree
