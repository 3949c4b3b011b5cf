// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filetree/FileOperations.hpp"

#include <session/SessionState.hpp>
#include <utils/PathUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>

namespace FileTree {

FileOperations::FileOperations(Session::SessionState& session, QObject* parent)
    : QObject(parent)
    , m_session(session)
{
}

QString FileOperations::markdownFileName(const QString& name)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty())
        return {};
    if (trimmed.endsWith(QStringLiteral(".md")) || trimmed.endsWith(QStringLiteral(".markdown")))
        return trimmed;
    return trimmed + QStringLiteral(".md");
}

Utils::Result FileOperations::fail(Operation op, const QString& path, const QString& message)
{
    qCWarning(filetreelog).noquote() << message;
    emit operationFailed(op, path, message);
    return Utils::Result::failure(message);
}

Utils::Result FileOperations::checkChildName(const QString& name) const
{
    if (name.isEmpty())
        return Utils::Result::failure(QStringLiteral("Name cannot be empty."));
    if (name == QStringLiteral(".") || name == QStringLiteral(".."))
        return Utils::Result::failure(QStringLiteral("'%1' is not a valid name.").arg(name));
    if (name.contains(u'/') || name.contains(u'\\'))
        return Utils::Result::failure(QStringLiteral("Name cannot contain path separators."));
    return Utils::Result::success();
}

Utils::Result FileOperations::renamePath(const QString& path, const QString& newName, QString* outNewPath)
{
    const QString abs = Utils::PathUtils::absoluteKey(path);
    const QFileInfo fi(abs);
    if (abs.isEmpty() || !fi.exists())
        return fail(Operation::Rename, path, QStringLiteral("Path does not exist: %1").arg(path));

    const QString name = newName.trimmed();
    const Utils::Result nameCheck = checkChildName(name);
    if (!nameCheck)
        return fail(Operation::Rename, abs, nameCheck.message());

    if (name == fi.fileName()) {
        if (outNewPath)
            *outNewPath = abs;
        return Utils::Result::success();
    }

    const QString newAbs = QDir::cleanPath(fi.absolutePath() + u'/' + name);
    if (QFileInfo::exists(newAbs))
        return fail(Operation::Rename, abs, QStringLiteral("A file or folder named '%1' already exists.").arg(name));

    QDir parentDir(fi.absolutePath());
    if (!parentDir.rename(fi.fileName(), name))
        return fail(Operation::Rename, abs, QStringLiteral("Failed to rename '%1'.").arg(fi.fileName()));

    m_session.movePath(abs, newAbs);

    if (outNewPath)
        *outNewPath = newAbs;

    emit operationCompleted(Operation::Rename, abs, newAbs);
    emit refreshRequested();
    return Utils::Result::success();
}

Utils::Result FileOperations::removePath(const QString& path)
{
    const QString abs = Utils::PathUtils::absoluteKey(path);
    const QFileInfo fi(abs);
    if (abs.isEmpty() || (!fi.exists() && !fi.isSymLink()))
        return fail(Operation::Delete, path, QStringLiteral("Path does not exist: %1").arg(path));

    bool ok = false;
    if (fi.isDir() && !fi.isSymLink())
        ok = QDir(abs).removeRecursively();
    else
        ok = QFile::remove(abs);

    if (!ok)
        return fail(Operation::Delete, abs, QStringLiteral("Failed to delete '%1'.").arg(fi.fileName()));

    m_session.forgetPath(abs);

    emit operationCompleted(Operation::Delete, abs, QString());
    emit refreshRequested();
    return Utils::Result::success();
}

Utils::Result FileOperations::createFolder(const QString& parentDir, const QString& name, QString* outNewPath)
{
    const QString dirPath = Utils::PathUtils::absoluteKey(parentDir);
    if (dirPath.isEmpty() || !QFileInfo(dirPath).isDir())
        return fail(Operation::NewFolder, parentDir, QStringLiteral("Target directory is invalid."));

    const QString trimmed = name.trimmed();
    const Utils::Result nameCheck = checkChildName(trimmed);
    if (!nameCheck)
        return fail(Operation::NewFolder, dirPath, nameCheck.message());

    QDir dir(dirPath);
    if (dir.exists(trimmed))
        return fail(Operation::NewFolder, dirPath, QStringLiteral("'%1' already exists.").arg(trimmed));

    if (!dir.mkdir(trimmed))
        return fail(Operation::NewFolder, dirPath, QStringLiteral("Failed to create folder '%1'.").arg(trimmed));

    const QString newAbs = QDir::cleanPath(dir.filePath(trimmed));
    if (outNewPath)
        *outNewPath = newAbs;

    emit operationCompleted(Operation::NewFolder, dirPath, newAbs);
    emit refreshRequested();
    return Utils::Result::success();
}

Utils::Result FileOperations::createMarkdownFile(const QString& parentDir, const QString& name, QString* outNewPath)
{
    const QString dirPath = Utils::PathUtils::absoluteKey(parentDir);
    if (dirPath.isEmpty() || !QFileInfo(dirPath).isDir())
        return fail(Operation::NewMarkdownFile, parentDir, QStringLiteral("Target directory is invalid."));

    const QString fileName = markdownFileName(name);
    const Utils::Result nameCheck = checkChildName(fileName);
    if (!nameCheck)
        return fail(Operation::NewMarkdownFile, dirPath, nameCheck.message());

    const QDir dir(dirPath);
    if (dir.exists(fileName))
        return fail(Operation::NewMarkdownFile, dirPath, QStringLiteral("'%1' already exists.").arg(fileName));

    const QString abs = QDir::cleanPath(dir.filePath(fileName));
    QSaveFile file(abs);
    if (!file.open(QIODevice::WriteOnly))
        return fail(Operation::NewMarkdownFile, dirPath, QStringLiteral("Failed to create '%1'.").arg(fileName));
    if (!file.commit())
        return fail(Operation::NewMarkdownFile, dirPath, QStringLiteral("Failed to save '%1'.").arg(fileName));

    if (outNewPath)
        *outNewPath = abs;

    emit operationCompleted(Operation::NewMarkdownFile, dirPath, abs);
    emit refreshRequested();
    return Utils::Result::success();
}

} // namespace FileTree
