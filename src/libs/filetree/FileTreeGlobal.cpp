// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "filetree/FileTreeGlobal.hpp"

Q_LOGGING_CATEGORY(filetreelog, "mdreader.filetree")
