// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/SessionGlobal.hpp"

Q_LOGGING_CATEGORY(sessionlog, "mdreader.session")
