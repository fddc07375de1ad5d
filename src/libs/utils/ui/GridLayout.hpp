// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"
#include "utils/ui/GridSpec.hpp"

#include <QtCore/QRectF>
#include <QtCore/QSizeF>

namespace Utils::GridLayout {

// Canvas needed for every cell of `spec`; empty for an invalid spec.
UTILS_EXPORT QSizeF contentSize(const GridSpec& spec);

// Null rect when `index` does not fit the grid.
UTILS_EXPORT QRectF rectForCell(const GridSpec& spec, int index);

} // namespace Utils::GridLayout
