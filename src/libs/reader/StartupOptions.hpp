// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/ReaderGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Reader {

// What `mdreader [file]` asked for. A path that does not name a readable
// file is kept so the window can warn about it after it is shown.
struct READER_EXPORT StartupOptions final {
    enum class Action {
        Run,
        ShowHelp,
        ShowVersion,
        Error
    };

    Action action = Action::Run;
    QString requestedPath;  // as typed
    QString filePath;       // absolute, set only when the file exists
    QString message;        // help, version or error text

    bool hasInvalidPath() const { return !requestedPath.isEmpty() && filePath.isEmpty(); }

    // arguments includes the program name, as QCoreApplication::arguments().
    static StartupOptions parse(const QStringList& arguments);
};

} // namespace Reader
