// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QMetaType>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>
#include <QtGui/QColor>

#include <optional>

namespace Session {

enum class MarkerColor : unsigned char {
    None,
    Green,
    Red
};

enum class ThemePreference : unsigned char {
    Light,
    Dark,
    Auto
};

enum class CodeFontWeight : unsigned char {
    Normal,
    Bold
};

// Policy constants. Passed to the store and the session model rather
// than baked into either, so a product change touches one place.
struct SESSION_EXPORT RecordLimits final {
    int maxRecentEntries = 10;
    int minFontSize = 8;
    int maxFontSize = 72;

    int clampFontSize(int size) const;
};

struct SESSION_EXPORT WindowGeometry final {
    int x = 100;
    int y = 100;
    int width = 1200;
    int height = 800;
    bool maximized = false;
    int splitterPosition = 300;

    bool operator==(const WindowGeometry&) const = default;
};

struct SESSION_EXPORT FontSettings final {
    int bodySize = 16;
    int codeSize = 14;
    QString codeFamily = defaultCodeFamily();
    CodeFontWeight codeWeight = CodeFontWeight::Normal;
    QColor inlineCodeColor;     // invalid: theme default
    QColor blockCodeColor;      // invalid: theme default

    static QString defaultCodeFamily();

    // Sizes clamped, empty family replaced, colours reduced to plain RGB(A).
    FontSettings sanitized(const RecordLimits& limits) const;

    bool operator==(const FontSettings&) const = default;
};

struct SESSION_EXPORT ConfigurationRecord final {
    WindowGeometry window;
    QStringList recentFiles;
    QStringList recentFolders;
    QHash<QString, MarkerColor> markers;
    QSet<QString> expandedDirectories;
    QHash<QString, int> scrollPositions;
    ThemePreference theme = ThemePreference::Auto;
    FontSettings font;
    QString lastFile;
    QString lastFolder;

    static ConfigurationRecord defaults();

    bool operator==(const ConfigurationRecord&) const = default;
};

SESSION_EXPORT QString markerToken(MarkerColor color);
SESSION_EXPORT std::optional<MarkerColor> markerFromToken(QStringView token);

SESSION_EXPORT QString themeToken(ThemePreference theme);
SESSION_EXPORT std::optional<ThemePreference> themeFromToken(QStringView token);

SESSION_EXPORT QString codeWeightToken(CodeFontWeight weight);
SESSION_EXPORT std::optional<CodeFontWeight> codeWeightFromToken(QStringView token);

} // namespace Session

Q_DECLARE_METATYPE(Session::MarkerColor)
Q_DECLARE_METATYPE(Session::ThemePreference)
