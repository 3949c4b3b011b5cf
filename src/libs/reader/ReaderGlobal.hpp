// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(READER_BUILD_SHARED) && (READER_BUILD_SHARED == 1)
#	if defined(READER_LIBRARY)
#		define READER_EXPORT Q_DECL_EXPORT
#	else
#		define READER_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define READER_EXPORT
#endif

READER_EXPORT Q_DECLARE_LOGGING_CATEGORY(readerlog)
