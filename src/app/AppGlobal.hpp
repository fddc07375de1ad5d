// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(APP_BUILD_SHARED) && (APP_BUILD_SHARED == 1)
#	if defined(APP_LIBRARY)
#		define APP_EXPORT Q_DECL_EXPORT
#	else
#		define APP_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define APP_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(applog)
