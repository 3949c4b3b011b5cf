// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/PreviewStyle.hpp"

#include <QtGui/QFontDatabase>

namespace Reader {

PreviewStyle PreviewStyle::make(ResolvedTheme theme, const Session::FontSettings& font)
{
    PreviewStyle style;
    style.theme = theme;

    style.bodyFont = QFontDatabase::systemFont(QFontDatabase::GeneralFont);
    style.bodyFont.setPixelSize(font.bodySize);

    const QStringList families = fontFamilies(font.codeFamily);
    if (!families.isEmpty())
        style.codeFont.setFamilies(families);
    style.codeFont.setStyleHint(QFont::Monospace);
    style.codeFont.setFixedPitch(true);
    style.codeFont.setPixelSize(font.codeSize);
    style.codeFont.setWeight(font.codeWeight == Session::CodeFontWeight::Bold ? QFont::Bold : QFont::Normal);

    if (theme == ResolvedTheme::Dark) {
        style.text = QColor(0xd4, 0xd4, 0xd4);
        style.background = QColor(0x1e, 0x1e, 0x1e);
        style.link = QColor(0x4e, 0x94, 0xce);
        style.inlineCode = QColor(0xce, 0x91, 0x78);
        style.inlineCodeBackground = QColor(0x2d, 0x2d, 0x30);
        style.blockCode = QColor(0xd4, 0xd4, 0xd4);
        style.blockCodeBackground = QColor(0x25, 0x25, 0x26);
    } else {
        style.text = QColor(0x24, 0x29, 0x2e);
        style.background = QColor(0xff, 0xff, 0xff);
        style.link = QColor(0x03, 0x66, 0xd6);
        style.inlineCode = QColor(0xd7, 0x3a, 0x49);
        style.inlineCodeBackground = QColor(0xf3, 0xf4, 0xf4);
        style.blockCode = QColor(0x24, 0x29, 0x2e);
        style.blockCodeBackground = QColor(0xf6, 0xf8, 0xfa);
    }

    if (font.inlineCodeColor.isValid())
        style.inlineCode = font.inlineCodeColor;
    if (font.blockCodeColor.isValid())
        style.blockCode = font.blockCodeColor;

    return style;
}

QStringList PreviewStyle::fontFamilies(const QString& familyList)
{
    static const QStringList generic = {
        QStringLiteral("monospace"), QStringLiteral("serif"), QStringLiteral("sans-serif"),
        QStringLiteral("cursive"), QStringLiteral("fantasy"), QStringLiteral("system-ui")
    };

    QStringList out;
    for (QString name : familyList.split(u',', Qt::SkipEmptyParts)) {
        name = name.trimmed();
        if (name.size() >= 2 && (name.front() == u'"' || name.front() == u'\'')
            && name.back() == name.front()) {
            name = name.mid(1, name.size() - 2).trimmed();
        }
        if (name.isEmpty() || generic.contains(name, Qt::CaseInsensitive))
            continue;
        out.push_back(name);
    }
    return out;
}

} // namespace Reader
