// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/ui/GridLayout.hpp"

#include <QtCore/QtMath>

namespace Utils {

GridSpec GridSpec::squarish(int count, const QSizeF& cellSize)
{
    GridSpec spec;
    spec.cellSize = cellSize;
    if (count > 0) {
        spec.columns = qCeil(qSqrt(double(count)));
        spec.rows = (count + spec.columns - 1) / spec.columns;
    }
    return spec;
}

namespace GridLayout {

namespace {

qreal span(int cells, qreal cell, qreal spacing)
{
    return cells * cell + qMax(0, cells - 1) * spacing;
}

} // namespace

QSizeF contentSize(const GridSpec& spec)
{
    if (!spec.isValid())
        return {};
    const qreal gap = qMax<qreal>(0.0, spec.spacing);
    const qreal border = 2 * qMax<qreal>(0.0, spec.margin);
    return {span(spec.columns, spec.cellSize.width(), gap) + border,
            span(spec.rows, spec.cellSize.height(), gap) + border};
}

QRectF rectForCell(const GridSpec& spec, int index)
{
    if (index < 0 || index >= spec.capacity())
        return {};

    const qreal gap = qMax<qreal>(0.0, spec.spacing);
    const qreal border = qMax<qreal>(0.0, spec.margin);
    const int column = index % spec.columns;
    const int row = index / spec.columns;
    return {QPointF(border + column * (spec.cellSize.width() + gap),
                    border + row * (spec.cellSize.height() + gap)),
            spec.cellSize};
}

} // namespace GridLayout
} // namespace Utils
