// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QSizeF>

namespace Utils {

// Uniform cells laid out row by row from the top-left corner.
struct UTILS_EXPORT GridSpec final {
    int columns = 0;
    int rows = 0;
    QSizeF cellSize;
    qreal spacing = 0.0;
    qreal margin = 0.0;

    bool isValid() const { return columns > 0 && rows > 0 && !cellSize.isEmpty(); }
    int capacity() const { return isValid() ? columns * rows : 0; }

    // ceil(sqrt(n)) columns and as many rows as needed for `count` cells.
    static GridSpec squarish(int count, const QSizeF& cellSize);
};

} // namespace Utils
