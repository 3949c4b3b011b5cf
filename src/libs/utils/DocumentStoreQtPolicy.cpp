// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/DocumentStoreQtPolicy.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>
#include <QtCore/QStandardPaths>

namespace Utils {

DocumentStorePaths QtDocumentStorePolicy::resolvePaths(const DocumentStoreConfig& cfg) const
{
    DocumentStorePaths out;

    // GenericConfigLocation is shared by every application; documents live
    // in a subdirectory named after ours.
    const QString base =
        !cfg.configRootOverride.isEmpty()
            ? cfg.configRootOverride
            : QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);

    const QString appDir = QDir(base).filePath(cfg.applicationName.isEmpty()
                                                   ? QStringLiteral("MarkdownReader")
                                                   : cfg.applicationName);
    out.configDir = QDir(appDir).absolutePath();
    return out;
}

QString QtDocumentStorePolicy::documentFilePath(const DocumentStorePaths& paths, QStringView name) const
{
    return QDir(paths.configDir).filePath(QStringLiteral("%1.json").arg(name.toString()));
}

bool QtDocumentStorePolicy::ensureStorage(const DocumentStorePaths& paths, QString* error) const
{
    if (paths.configDir.isEmpty()) {
        if (error) *error = QStringLiteral("Configuration directory is empty.");
        return false;
    }

    QDir d(paths.configDir);
    if (d.exists())
        return true;
    if (!d.mkpath(QStringLiteral("."))) {
        if (error) *error = QStringLiteral("Failed to create directory: %1").arg(paths.configDir);
        return false;
    }
    return true;
}

bool QtDocumentStorePolicy::readBytes(const DocumentStorePaths& paths, QStringView name,
                                      QByteArray* out, QString* error) const
{
    if (out) out->clear();

    const QString path = documentFilePath(paths, name);
    QFile f(path);
    if (!f.exists()) {
        // not found is not an error
        if (error) error->clear();
        return false;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("Failed to open %1 (%2)").arg(path, f.errorString());
        return false;
    }
    const QByteArray bytes = f.readAll();
    if (out) *out = bytes;
    if (error) error->clear();
    return true;
}

bool QtDocumentStorePolicy::writeBytesAtomic(const DocumentStorePaths& paths, QStringView name,
                                             const QByteArray& bytes, QString* error) const
{
    const QString target = documentFilePath(paths, name);

    {
        const QFileInfo fi(target);
        QDir dir(fi.absolutePath());
        if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
            if (error) *error = QStringLiteral("Failed to create directory: %1").arg(fi.absolutePath());
            return false;
        }
    }

    QSaveFile sf(target);
    if (!sf.open(QIODevice::WriteOnly)) {
        if (error) *error = QStringLiteral("Failed to open %1 for write (%2)").arg(target, sf.errorString());
        return false;
    }

    const qint64 written = sf.write(bytes);
    if (written != bytes.size()) {
        const QString reason = sf.errorString();
        sf.cancelWriting();
        if (error) *error = QStringLiteral("Failed to write complete document: %1 (%2)").arg(target, reason);
        return false;
    }

    if (!sf.commit()) {
        if (error) *error = QStringLiteral("Failed to commit document: %1 (%2)").arg(target, sf.errorString());
        return false;
    }

    if (error) error->clear();
    return true;
}

} // namespace Utils
