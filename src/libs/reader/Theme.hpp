// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/ReaderGlobal.hpp"

#include <session/ConfigurationRecord.hpp>

#include <QtGui/QPalette>

namespace Reader {

enum class ResolvedTheme : unsigned char {
    Light,
    Dark
};

// Auto follows the system; the explicit preferences win over it.
READER_EXPORT ResolvedTheme resolveTheme(Session::ThemePreference preference, ResolvedTheme system);

READER_EXPORT QPalette windowPalette(ResolvedTheme theme);

READER_EXPORT QString themeDisplayName(Session::ThemePreference preference);

} // namespace Reader
