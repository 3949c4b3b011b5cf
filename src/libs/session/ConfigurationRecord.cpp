// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/ConfigurationRecord.hpp"

#include <algorithm>

namespace Session {

namespace {

using namespace Qt::StringLiterals;

QColor plainColor(const QColor& color)
{
    if (!color.isValid())
        return {};
    const QColor rgb = color.toRgb();
    return QColor(rgb.red(), rgb.green(), rgb.blue(), rgb.alpha());
}

} // namespace

int RecordLimits::clampFontSize(int size) const
{
    const int lo = std::min(minFontSize, maxFontSize);
    const int hi = std::max(minFontSize, maxFontSize);
    return std::clamp(size, lo, hi);
}

QString FontSettings::defaultCodeFamily()
{
    return u"Consolas, Monaco, \"Courier New\", monospace"_s;
}

FontSettings FontSettings::sanitized(const RecordLimits& limits) const
{
    FontSettings out = *this;
    out.bodySize = limits.clampFontSize(bodySize);
    out.codeSize = limits.clampFontSize(codeSize);
    out.codeFamily = codeFamily.trimmed();
    if (out.codeFamily.isEmpty())
        out.codeFamily = defaultCodeFamily();
    out.inlineCodeColor = plainColor(inlineCodeColor);
    out.blockCodeColor = plainColor(blockCodeColor);
    return out;
}

ConfigurationRecord ConfigurationRecord::defaults()
{
    return ConfigurationRecord{};
}

QString markerToken(MarkerColor color)
{
    switch (color) {
    case MarkerColor::Green: return u"green"_s;
    case MarkerColor::Red:   return u"red"_s;
    case MarkerColor::None:  break;
    }
    return u"none"_s;
}

std::optional<MarkerColor> markerFromToken(QStringView token)
{
    const QString t = token.trimmed().toString().toLower();
    if (t == u"green")
        return MarkerColor::Green;
    if (t == u"red")
        return MarkerColor::Red;
    if (t == u"none")
        return MarkerColor::None;
    return std::nullopt;
}

QString themeToken(ThemePreference theme)
{
    switch (theme) {
    case ThemePreference::Light: return u"light"_s;
    case ThemePreference::Dark:  return u"dark"_s;
    case ThemePreference::Auto:  break;
    }
    return u"auto"_s;
}

std::optional<ThemePreference> themeFromToken(QStringView token)
{
    const QString t = token.trimmed().toString().toLower();
    if (t == u"light")
        return ThemePreference::Light;
    if (t == u"dark")
        return ThemePreference::Dark;
    if (t == u"auto")
        return ThemePreference::Auto;
    return std::nullopt;
}

QString codeWeightToken(CodeFontWeight weight)
{
    return weight == CodeFontWeight::Bold ? u"bold"_s : u"normal"_s;
}

std::optional<CodeFontWeight> codeWeightFromToken(QStringView token)
{
    const QString t = token.trimmed().toString().toLower();
    if (t == u"bold")
        return CodeFontWeight::Bold;
    if (t == u"normal")
        return CodeFontWeight::Normal;
    return std::nullopt;
}

} // namespace Session
