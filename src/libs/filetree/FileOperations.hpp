// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "filetree/FileTreeGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QString>

namespace Session {
class SessionState;
}

namespace FileTree {

// Filesystem edits issued from the tree. Each keeps the session's
// path-keyed entries in step with the disk.
class FILETREE_EXPORT FileOperations final : public QObject
{
    Q_OBJECT

public:
    enum class Operation {
        Rename,
        Delete,
        NewFolder,
        NewMarkdownFile
    };
    Q_ENUM(Operation)

    explicit FileOperations(Session::SessionState& session, QObject* parent = nullptr);

    Utils::Result renamePath(const QString& path, const QString& newName, QString* outNewPath = nullptr);
    Utils::Result removePath(const QString& path);
    Utils::Result createFolder(const QString& parentDir, const QString& name, QString* outNewPath = nullptr);
    Utils::Result createMarkdownFile(const QString& parentDir, const QString& name, QString* outNewPath = nullptr);

    // Appends ".md" unless the name already ends in a Markdown extension.
    static QString markdownFileName(const QString& name);

signals:
    void operationCompleted(FileTree::FileOperations::Operation op, const QString& path, const QString& newPath);
    void operationFailed(FileTree::FileOperations::Operation op, const QString& path, const QString& error);
    void refreshRequested();

private:
    Utils::Result fail(Operation op, const QString& path, const QString& message);
    Utils::Result checkChildName(const QString& name) const;

    Session::SessionState& m_session;
};

} // namespace FileTree
