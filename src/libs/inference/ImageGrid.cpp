// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/ImageGrid.hpp"

#include <utils/Macros.hpp>
#include <utils/ui/GridLayout.hpp>

#include <QtCore/QSizeF>
#include <QtGui/QImageReader>
#include <QtGui/QPainter>

#include <algorithm>
#include <utility>

namespace Inference {

Utils::GridSpec ImageGrid::layoutFor(const QVector<QImage>& images)
{
    int cellWidth = 0;
    int cellHeight = 0;
    for (const QImage& image : images) {
        cellWidth = std::max(cellWidth, image.width());
        cellHeight = std::max(cellHeight, image.height());
    }
    return Utils::GridSpec::squarish(images.size(), QSizeF(cellWidth, cellHeight));
}

QImage ImageGrid::compose(const QVector<QImage>& images)
{
    const Utils::GridSpec spec = layoutFor(images);
    if (!spec.isValid())
        return {};

    const QSize canvasSize = Utils::GridLayout::contentSize(spec).toSize();
    if (canvasSize.isEmpty())
        return {};

    QImage canvas(canvasSize, QImage::Format_ARGB32_Premultiplied);
    canvas.fill(Qt::transparent);

    QPainter painter(&canvas);
    for (int i = 0; i < images.size(); ++i) {
        if (images[i].isNull())
            continue;
        const QRectF cell = Utils::GridLayout::rectForCell(spec, i);
        painter.drawImage(cell.topLeft(), images[i]);
    }
    painter.end();

    return canvas;
}

Utils::Result ImageGrid::composeFiles(const QStringList& inputPaths, const QString& outputPath)
{
    QVector<QImage> images;
    images.reserve(inputPaths.size());
    for (const QString& path : inputPaths) {
        QImageReader reader(path);
        QImage image = reader.read();
        if (image.isNull()) {
            return Utils::Result::failure(QStringLiteral("Failed to read image %1: %2")
                                              .arg(path, reader.errorString()));
        }
        images.push_back(std::move(image));
    }

    const QImage grid = compose(images);
    UTILS_GUARD_OK(!grid.isNull(), QStringLiteral("No images to compose into a grid."));

    if (!grid.save(outputPath))
        return Utils::Result::failure(QStringLiteral("Failed to write grid image %1").arg(outputPath));

    qCDebug(inferencelog) << "Wrote image grid" << outputPath << grid.size();
    return Utils::Result::success();
}

} // namespace Inference
