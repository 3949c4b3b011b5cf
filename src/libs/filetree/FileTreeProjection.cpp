// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filetree/FileTreeProjection.hpp"

#include <session/SessionState.hpp>
#include <utils/PathUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

#include <algorithm>

namespace FileTree {

namespace {

QString childKey(const QString& parent, const QString& name)
{
    return QDir::cleanPath(parent + u'/' + name);
}

QString displayName(const QString& key)
{
    const QString name = Utils::PathUtils::basename(key);
    return name.isEmpty() ? key : name;
}

} // namespace

QStringList FileTreeProjection::defaultExtensions()
{
    return {QStringLiteral("md"), QStringLiteral("markdown")};
}

bool FileTreeProjection::lessThan(const Node& a, const Node& b)
{
    if (a.isDirectory != b.isDirectory)
        return a.isDirectory;

    const int ci = QString::compare(a.name, b.name, Qt::CaseInsensitive);
    if (ci != 0)
        return ci < 0;
    return QString::compare(a.name, b.name, Qt::CaseSensitive) < 0;
}

ScanResult FileTreeProjection::scan(const QString& rootPath, const QStringList& extensions)
{
    ScanResult result;

    const QString rootKey = Utils::PathUtils::absoluteKey(rootPath);
    result.tree.path = rootKey;
    result.tree.name = displayName(rootKey);
    result.tree.isDirectory = true;

    const QFileInfo rootInfo(rootKey);
    if (rootKey.isEmpty() || !rootInfo.exists() || !rootInfo.isDir()) {
        qCDebug(filetreelog) << "Tree root is not a readable directory:" << rootPath;
        result.tree.error = true;
        result.errorCount = 1;
        return result;
    }

    result.livePaths.insert(rootKey);
    scanDirectory(result.tree, Utils::PathUtils::normalizeExtensions(extensions), result);
    return result;
}

void FileTreeProjection::scanDirectory(Node& dir, const QStringList& extensions, ScanResult& out)
{
    const QDir qdir(dir.path);
    if (!qdir.exists() || !qdir.isReadable()) {
        qCDebug(filetreelog) << "Cannot list directory" << dir.path;
        dir.error = true;
        ++out.errorCount;
        return;
    }

    const QFileInfoList entries =
        qdir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                           QDir::NoSort);

    for (const QFileInfo& info : entries) {
        const QString key = childKey(dir.path, info.fileName());
        out.livePaths.insert(key);

        Node child;
        child.path = key;
        child.name = info.fileName();

        if (info.isDir()) {
            child.isDirectory = true;
            // Symlinked directories are listed but never followed, so a
            // link cycle cannot make the walk unbounded.
            if (info.isSymLink())
                out.unwalked.insert(key);
            else
                scanDirectory(child, extensions, out);
        } else if (!Utils::PathUtils::hasExtensionIn(key, extensions)) {
            continue;
        }

        dir.children.push_back(std::move(child));
    }

    std::sort(dir.children.begin(), dir.children.end(), &FileTreeProjection::lessThan);
}

Node FileTreeProjection::decorate(const ScanResult& scanned, const Session::SessionState& session)
{
    Node root = scanned.tree;
    decorateNode(root, session);
    return root;
}

void FileTreeProjection::decorateNode(Node& node, const Session::SessionState& session)
{
    node.marker = session.marker(node.path);
    node.expanded = node.isDirectory && session.isExpanded(node.path);
    for (Node& child : node.children)
        decorateNode(child, session);
}

Node FileTreeProjection::project(const QString& rootPath,
                                 const QStringList& extensions,
                                 const Session::SessionState& session)
{
    return decorate(scan(rootPath, extensions), session);
}

} // namespace FileTree
