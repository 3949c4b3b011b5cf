// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/ReaderGlobal.hpp"
#include "reader/Theme.hpp"

#include <session/ConfigurationRecord.hpp>

#include <QtGui/QColor>
#include <QtCore/QStringList>
#include <QtGui/QFont>

namespace Reader {

// Fonts and colours applied to a rendered document. Colour overrides
// from the font settings replace the theme's code colours.
struct READER_EXPORT PreviewStyle final {
    ResolvedTheme theme = ResolvedTheme::Light;
    QFont bodyFont;
    QFont codeFont;
    QColor text;
    QColor background;
    QColor link;
    QColor inlineCode;
    QColor inlineCodeBackground;
    QColor blockCode;
    QColor blockCodeBackground;

    static PreviewStyle make(ResolvedTheme theme, const Session::FontSettings& font);

    // Splits a CSS-style family list ("Consolas, \"Courier New\", monospace")
    // into family names. Generic keywords are dropped.
    static QStringList fontFamilies(const QString& familyList);
};

} // namespace Reader
