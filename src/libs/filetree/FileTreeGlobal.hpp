// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(FILETREE_BUILD_SHARED) && (FILETREE_BUILD_SHARED == 1)
#	if defined(FILETREE_LIBRARY)
#		define FILETREE_EXPORT Q_DECL_EXPORT
#	else
#		define FILETREE_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define FILETREE_EXPORT
#endif

FILETREE_EXPORT Q_DECLARE_LOGGING_CATEGORY(filetreelog)
