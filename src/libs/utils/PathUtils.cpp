// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace Utils::PathUtils {

namespace {

QString stripDot(QStringView ext)
{
    QString s = ext.trimmed().toString();
    while (s.startsWith('.'))
        s.remove(0, 1);
    return s;
}

} // namespace

QString normalizePath(QStringView path)
{
    QString s = QDir::fromNativeSeparators(path.toString()).trimmed();
    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        cleaned.clear();
    return cleaned;
}

QString absoluteKey(QStringView path)
{
    const QString cleaned = normalizePath(path);
    if (cleaned.isEmpty())
        return {};

    const QString expanded = cleaned.startsWith(QStringLiteral("~/"))
                                 ? QDir::home().filePath(cleaned.mid(2))
                                 : cleaned;
    return QDir::cleanPath(QDir::fromNativeSeparators(QFileInfo(expanded).absoluteFilePath()));
}

QString basename(QStringView path)
{
    const QString cleaned = normalizePath(path);
    if (cleaned.isEmpty())
        return {};

    const int slash = cleaned.lastIndexOf('/');
    if (slash < 0)
        return cleaned;
    if (slash == cleaned.size() - 1)
        return {};
    return cleaned.mid(slash + 1);
}

QString extension(QStringView path)
{
    const QString name = basename(path);
    const int dot = name.lastIndexOf('.');
    if (dot <= 0)
        return {};
    return name.mid(dot + 1);
}

QString parentPath(QStringView path)
{
    const QString cleaned = normalizePath(path);
    const int slash = cleaned.lastIndexOf('/');
    if (slash < 0)
        return {};
    if (slash == 0)
        return QStringLiteral("/");
    return cleaned.left(slash);
}

bool hasExtension(QStringView path, QStringView ext, Qt::CaseSensitivity cs)
{
    const QString current = extension(path);
    const QString wanted = stripDot(ext);
    if (wanted.isEmpty())
        return false;
    return QString::compare(current, wanted, cs) == 0;
}

bool hasExtensionIn(QStringView path, const QStringList& extensions)
{
    const QString current = extension(path);
    if (current.isEmpty())
        return false;

    for (const QString& ext : extensions) {
        if (QString::compare(current, stripDot(ext), Qt::CaseInsensitive) == 0)
            return true;
    }
    return false;
}

QStringList normalizeExtensions(const QStringList& extensions)
{
    QStringList out;
    out.reserve(extensions.size());
    for (const QString& raw : extensions) {
        const QString ext = stripDot(raw).toLower();
        if (!ext.isEmpty() && !out.contains(ext))
            out.push_back(ext);
    }
    return out;
}

bool isSameOrDescendant(QStringView path, QStringView ancestor)
{
    const QString p = normalizePath(path);
    const QString a = normalizePath(ancestor);
    if (p.isEmpty() || a.isEmpty())
        return false;
    if (p == a)
        return true;
    // Roots ("/", "C:/") keep their trailing slash after cleaning.
    if (a.endsWith(u'/'))
        return p.startsWith(a);
    return p.startsWith(a) && p.at(a.size()) == u'/';
}

QString rebase(QStringView path, QStringView fromAncestor, QStringView toAncestor)
{
    const QString p = normalizePath(path);
    const QString from = normalizePath(fromAncestor);
    if (!isSameOrDescendant(p, from))
        return p;

    const QString to = normalizePath(toAncestor);
    if (p == from)
        return to;

    const QString tail = from.endsWith(u'/') ? p.mid(from.size()) : p.mid(from.size() + 1);
    return to.endsWith('/') ? to + tail : to + u'/' + tail;
}

} // namespace Utils::PathUtils
