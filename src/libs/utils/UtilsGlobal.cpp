// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/UtilsGlobal.hpp"

Q_LOGGING_CATEGORY(utilslog, "kiln.utils")
