// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(PACKAGES_BUILD_SHARED) && (PACKAGES_BUILD_SHARED == 1)
#	if defined(PACKAGES_LIBRARY)
#		define PACKAGES_EXPORT Q_DECL_EXPORT
#	else
#		define PACKAGES_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define PACKAGES_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(packageslog)
