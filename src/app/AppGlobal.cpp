// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/AppGlobal.hpp"

Q_LOGGING_CATEGORY(applog, "kiln.app")
