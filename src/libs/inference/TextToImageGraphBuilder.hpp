// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"
#include "inference/NodeGraph.hpp"
#include "inference/TextToImageParameters.hpp"

#include <QtCore/QString>

namespace Inference {

// Node names of the text-to-image prompt. Result handling reads the output of SaveImage.
namespace TextToImageNodes {
inline const QString CheckpointLoader = QStringLiteral("CheckpointLoader");
inline const QString EmptyLatentImage = QStringLiteral("EmptyLatentImage");
inline const QString Sampler = QStringLiteral("Sampler");
inline const QString PositiveClip = QStringLiteral("PositiveCLIP");
inline const QString NegativeClip = QStringLiteral("NegativeCLIP");
inline const QString VaeDecoder = QStringLiteral("VAEDecoder");
inline const QString SaveImage = QStringLiteral("SaveImage");
inline const QString LatentUpscale = QStringLiteral("LatentUpscale");
inline const QString HiresSampler = QStringLiteral("Sampler2");
} // namespace TextToImageNodes

class INFERENCE_EXPORT TextToImageGraphBuilder final
{
public:
    static inline const QString OutputPrefix = QStringLiteral("Kiln-Inference");

    // Deterministic for a given parameter set. Unset model and sampler names become JSON null.
    static NodeGraph build(const TextToImageParameters& parameters);
};

} // namespace Inference
