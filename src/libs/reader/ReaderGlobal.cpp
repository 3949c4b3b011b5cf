// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/ReaderGlobal.hpp"

Q_LOGGING_CATEGORY(readerlog, "mdreader.reader")
