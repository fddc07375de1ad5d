// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/TextToImageParameters.hpp"

#include <QtCore/QJsonValue>

using namespace Qt::StringLiterals;

namespace Inference {

namespace {

void readString(const QJsonObject& o, QLatin1StringView key, QString& out)
{
    const QJsonValue v = o.value(key);
    if (v.isString())
        out = v.toString();
}

void readInt(const QJsonObject& o, QLatin1StringView key, int& out)
{
    const QJsonValue v = o.value(key);
    if (v.isDouble())
        out = v.toInt(out);
}

void readDouble(const QJsonObject& o, QLatin1StringView key, double& out)
{
    const QJsonValue v = o.value(key);
    if (v.isDouble())
        out = v.toDouble(out);
}

void readBool(const QJsonObject& o, QLatin1StringView key, bool& out)
{
    const QJsonValue v = o.value(key);
    if (v.isBool())
        out = v.toBool(out);
}

} // namespace

QJsonObject TextToImageParameters::toJson() const
{
    const QJsonObject hiresObject{
        {"upscaleMethod"_L1, hires.upscaleMethod},
        {"scale"_L1, hires.scale},
        {"samplerName"_L1, hires.samplerName},
        {"steps"_L1, hires.steps},
        {"cfgScale"_L1, hires.cfgScale},
        {"denoise"_L1, hires.denoise},
    };

    return QJsonObject{
        {"modelName"_L1, modelName},
        {"samplerName"_L1, samplerName},
        {"scheduler"_L1, scheduler},
        {"width"_L1, width},
        {"height"_L1, height},
        {"steps"_L1, steps},
        {"cfgScale"_L1, cfgScale},
        // Seeds exceed the exact range of a JSON number.
        {"seed"_L1, QString::number(seed)},
        {"randomizeSeed"_L1, randomizeSeed},
        {"batchSize"_L1, batchSize},
        {"positivePrompt"_L1, positivePrompt},
        {"negativePrompt"_L1, negativePrompt},
        {"hiresEnabled"_L1, hiresEnabled},
        {"hires"_L1, hiresObject},
    };
}

TextToImageParameters TextToImageParameters::fromJson(const QJsonObject& object)
{
    TextToImageParameters p;
    readString(object, "modelName"_L1, p.modelName);
    readString(object, "samplerName"_L1, p.samplerName);
    readString(object, "scheduler"_L1, p.scheduler);
    readInt(object, "width"_L1, p.width);
    readInt(object, "height"_L1, p.height);
    readInt(object, "steps"_L1, p.steps);
    readDouble(object, "cfgScale"_L1, p.cfgScale);
    readBool(object, "randomizeSeed"_L1, p.randomizeSeed);
    readInt(object, "batchSize"_L1, p.batchSize);
    readString(object, "positivePrompt"_L1, p.positivePrompt);
    readString(object, "negativePrompt"_L1, p.negativePrompt);
    readBool(object, "hiresEnabled"_L1, p.hiresEnabled);

    bool seedOk = false;
    const qint64 seed = object.value("seed"_L1).toString().toLongLong(&seedOk);
    if (seedOk)
        p.seed = seed;

    const QJsonObject h = object.value("hires"_L1).toObject();
    readString(h, "upscaleMethod"_L1, p.hires.upscaleMethod);
    readDouble(h, "scale"_L1, p.hires.scale);
    readString(h, "samplerName"_L1, p.hires.samplerName);
    readInt(h, "steps"_L1, p.hires.steps);
    readDouble(h, "cfgScale"_L1, p.hires.cfgScale);
    readDouble(h, "denoise"_L1, p.hires.denoise);

    return p;
}

} // namespace Inference
