// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "packages/PackagesGlobal.hpp"

Q_LOGGING_CATEGORY(packageslog, "kiln.packages")
