#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/Qt>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

// Cleaned, '/'-separated form; "." collapses to empty.
UTILS_EXPORT QString normalizePath(QStringView path);

// Absolute, cleaned, '/'-separated form used as a key in persisted maps.
UTILS_EXPORT QString absoluteKey(QStringView path);

UTILS_EXPORT QString basename(QStringView path);
UTILS_EXPORT QString extension(QStringView path);
UTILS_EXPORT QString parentPath(QStringView path);

UTILS_EXPORT bool hasExtension(QStringView path,
                               QStringView ext,
                               Qt::CaseSensitivity cs = Qt::CaseInsensitive);
UTILS_EXPORT bool hasExtensionIn(QStringView path, const QStringList& extensions);
UTILS_EXPORT QStringList normalizeExtensions(const QStringList& extensions);

UTILS_EXPORT bool isSameOrDescendant(QStringView path, QStringView ancestor);
UTILS_EXPORT QString rebase(QStringView path, QStringView fromAncestor, QStringView toAncestor);

} // namespace Utils::PathUtils
