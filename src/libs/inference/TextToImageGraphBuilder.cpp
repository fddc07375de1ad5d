// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/TextToImageGraphBuilder.hpp"

#include <QtCore/QtMath>

using namespace Qt::StringLiterals;

namespace Inference {

namespace {

namespace N = TextToImageNodes;

NodeInput optionalText(const QString& value)
{
    if (value.isEmpty())
        return std::monostate{};
    return value;
}

NodeReference ref(const QString& node, int slot)
{
    return NodeReference{node, slot};
}

ComfyNode makeSampler(const QString& name,
                      const TextToImageParameters& p,
                      const QString& latentSource,
                      double cfg,
                      double denoise,
                      const QString& samplerName,
                      int steps)
{
    ComfyNode node(name, u"KSampler"_s);
    node.set(u"cfg"_s, cfg)
        .set(u"denoise"_s, denoise)
        .set(u"latent_image"_s, ref(latentSource, 0))
        .set(u"model"_s, ref(N::CheckpointLoader, 0))
        .set(u"negative"_s, ref(N::NegativeClip, 0))
        .set(u"positive"_s, ref(N::PositiveClip, 0))
        .set(u"sampler_name"_s, optionalText(samplerName))
        .set(u"scheduler"_s, p.scheduler)
        .set(u"seed"_s, p.seed)
        .set(u"steps"_s, qint64(steps));
    return node;
}

ComfyNode makeClip(const QString& name, const QString& text)
{
    ComfyNode node(name, u"CLIPTextEncode"_s);
    node.set(u"clip"_s, ref(N::CheckpointLoader, 1))
        .set(u"text"_s, text);
    return node;
}

} // namespace

NodeGraph TextToImageGraphBuilder::build(const TextToImageParameters& p)
{
    NodeGraph graph;

    ComfyNode checkpoint(N::CheckpointLoader, u"CheckpointLoaderSimple"_s);
    checkpoint.set(u"ckpt_name"_s, optionalText(p.modelName));
    graph.add(std::move(checkpoint));

    ComfyNode latent(N::EmptyLatentImage, u"EmptyLatentImage"_s);
    latent.set(u"batch_size"_s, qint64(p.batchSize))
        .set(u"height"_s, qint64(p.height))
        .set(u"width"_s, qint64(p.width));
    graph.add(std::move(latent));

    graph.add(makeSampler(N::Sampler, p, N::EmptyLatentImage, p.cfgScale, 1.0, p.samplerName, p.steps));
    graph.add(makeClip(N::PositiveClip, p.positivePrompt));
    graph.add(makeClip(N::NegativeClip, p.negativePrompt));

    ComfyNode decoder(N::VaeDecoder, u"VAEDecode"_s);
    decoder.set(u"samples"_s, ref(N::Sampler, 0))
        .set(u"vae"_s, ref(N::CheckpointLoader, 2));
    graph.add(std::move(decoder));

    ComfyNode save(N::SaveImage, u"SaveImage"_s);
    save.set(u"filename_prefix"_s, OutputPrefix)
        .set(u"images"_s, ref(N::VaeDecoder, 0));
    graph.add(std::move(save));

    if (!p.hiresEnabled)
        return graph;

    const HiresParameters& h = p.hires;

    ComfyNode upscale(N::LatentUpscale, u"LatentUpscale"_s);
    upscale.set(u"upscale_method"_s, h.upscaleMethod)
        .set(u"width"_s, qint64(qRound(p.width * h.scale)))
        .set(u"height"_s, qint64(qRound(p.height * h.scale)))
        .set(u"crop"_s, u"disabled"_s)
        .set(u"samples"_s, ref(N::Sampler, 0));
    graph.add(std::move(upscale));

    const QString hiresSampler = h.samplerName.isEmpty() ? p.samplerName : h.samplerName;
    graph.add(makeSampler(N::HiresSampler, p, N::LatentUpscale, h.cfgScale, h.denoise, hiresSampler, h.steps));

    graph.find(N::VaeDecoder)->set(u"samples"_s, ref(N::HiresSampler, 0));
    return graph;
}

} // namespace Inference
