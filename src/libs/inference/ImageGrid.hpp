// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"

#include <utils/Result.hpp>
#include <utils/ui/GridSpec.hpp>

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>
#include <QtGui/QImage>

namespace Inference {

// Contact sheet of generated images. Safe to call from worker threads.
class INFERENCE_EXPORT ImageGrid final
{
public:
    // Layout used by compose(): near-square, row-major, one cell per image sized to the largest.
    static Utils::GridSpec layoutFor(const QVector<QImage>& images);

    // Null images still occupy their cell. Returns a null image when `images` is empty.
    static QImage compose(const QVector<QImage>& images);

    // Loads every file, composes them and writes the grid to `outputPath`.
    static Utils::Result composeFiles(const QStringList& inputPaths, const QString& outputPath);
};

} // namespace Inference
