// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(INFERENCE_BUILD_SHARED) && (INFERENCE_BUILD_SHARED == 1)
#	if defined(INFERENCE_LIBRARY)
#		define INFERENCE_EXPORT Q_DECL_EXPORT
#	else
#		define INFERENCE_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define INFERENCE_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(inferencelog)
