// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/Theme.hpp"

#include <QtCore/QCoreApplication>
#include <QtGui/QColor>

namespace Reader {

ResolvedTheme resolveTheme(Session::ThemePreference preference, ResolvedTheme system)
{
    switch (preference) {
    case Session::ThemePreference::Light:
        return ResolvedTheme::Light;
    case Session::ThemePreference::Dark:
        return ResolvedTheme::Dark;
    case Session::ThemePreference::Auto:
        break;
    }
    return system;
}

QPalette windowPalette(ResolvedTheme theme)
{
    if (theme == ResolvedTheme::Light)
        return QPalette(QColor(0xf6, 0xf8, 0xfa));

    QPalette p;
    const QColor window(0x1e, 0x1e, 0x1e);
    const QColor base(0x25, 0x25, 0x26);
    const QColor text(0xd4, 0xd4, 0xd4);
    const QColor disabledText(0x80, 0x80, 0x80);

    p.setColor(QPalette::Window, window);
    p.setColor(QPalette::WindowText, text);
    p.setColor(QPalette::Base, base);
    p.setColor(QPalette::AlternateBase, window);
    p.setColor(QPalette::Text, text);
    p.setColor(QPalette::Button, QColor(0x2d, 0x2d, 0x30));
    p.setColor(QPalette::ButtonText, text);
    p.setColor(QPalette::ToolTipBase, base);
    p.setColor(QPalette::ToolTipText, text);
    p.setColor(QPalette::Highlight, QColor(0x26, 0x4f, 0x78));
    p.setColor(QPalette::HighlightedText, Qt::white);
    p.setColor(QPalette::Link, QColor(0x4e, 0x94, 0xce));
    p.setColor(QPalette::PlaceholderText, disabledText);
    p.setColor(QPalette::Disabled, QPalette::Text, disabledText);
    p.setColor(QPalette::Disabled, QPalette::WindowText, disabledText);
    p.setColor(QPalette::Disabled, QPalette::ButtonText, disabledText);
    return p;
}

QString themeDisplayName(Session::ThemePreference preference)
{
    switch (preference) {
    case Session::ThemePreference::Light:
        return QCoreApplication::translate("Reader", "Light");
    case Session::ThemePreference::Dark:
        return QCoreApplication::translate("Reader", "Dark");
    case Session::ThemePreference::Auto:
        break;
    }
    return QCoreApplication::translate("Reader", "Follow System");
}

} // namespace Reader
