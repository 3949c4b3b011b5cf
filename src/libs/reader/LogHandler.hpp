// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/ReaderGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QDate>
#include <QtCore/QDateTime>
#include <QtCore/QString>

namespace Reader {

// Mirrors every Qt message into <logDir>/mdreader_YYYYMMDD.log as well as
// stderr. An empty logDir means <AppLocalDataLocation>/logs. Call after
// the application name is set.
READER_EXPORT Utils::Result installLogHandler(const QString& logDir = {});
READER_EXPORT void uninstallLogHandler();

READER_EXPORT QString logFilePath(const QString& logDir, const QDate& date);
READER_EXPORT QString formatLogLine(QtMsgType type, const char* category,
                                    const QString& message, const QDateTime& when);

// Font rasterizer noise that Windows emits for some system fonts.
READER_EXPORT bool isSuppressedLogMessage(const QString& message);

} // namespace Reader
