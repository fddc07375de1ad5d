// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Inference {

struct INFERENCE_EXPORT HiresParameters final {
    QString upscaleMethod = QStringLiteral("nearest-exact");
    double scale = 1.5;
    QString samplerName;        // empty: reuse the first-pass sampler
    int steps = 10;
    double cfgScale = 7.0;
    double denoise = 0.5;

    bool operator==(const HiresParameters&) const = default;
};

struct INFERENCE_EXPORT TextToImageParameters final {
    QString modelName;
    QString samplerName;
    QString scheduler = QStringLiteral("normal");
    int width = 512;
    int height = 512;
    int steps = 20;
    double cfgScale = 7.0;
    qint64 seed = 0;
    bool randomizeSeed = true;
    int batchSize = 1;
    QString positivePrompt;
    QString negativePrompt;

    bool hiresEnabled = false;
    HiresParameters hires;

    bool operator==(const TextToImageParameters&) const = default;

    QJsonObject toJson() const;

    // Keys that are absent or of the wrong type keep their default value.
    static TextToImageParameters fromJson(const QJsonObject& object);
};

} // namespace Inference
