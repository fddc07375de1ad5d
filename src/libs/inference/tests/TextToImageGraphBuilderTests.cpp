// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "inference/TextToImageGraphBuilder.hpp"

using namespace Qt::StringLiterals;
using Inference::NodeGraph;
using Inference::NodeInput;
using Inference::NodeReference;
using Inference::TextToImageGraphBuilder;
using Inference::TextToImageParameters;
namespace Nodes = Inference::TextToImageNodes;

namespace {

TextToImageParameters makeParameters()
{
    TextToImageParameters p;
    p.modelName = u"sd_xl_base_1.0.safetensors"_s;
    p.samplerName = u"euler_ancestral"_s;
    p.width = 640;
    p.height = 448;
    p.seed = 123456789;
    p.positivePrompt = u"a lighthouse at dusk"_s;
    p.negativePrompt = u"blurry"_s;
    return p;
}

const NodeInput& inputOf(const NodeGraph& graph, const QString& node, const QString& key)
{
    const Inference::ComfyNode* n = graph.find(node);
    EXPECT_NE(n, nullptr) << node.toStdString();
    const NodeInput* in = n ? n->input(key) : nullptr;
    EXPECT_NE(in, nullptr) << key.toStdString();
    static const NodeInput kMissing;
    return in ? *in : kMissing;
}

NodeReference refOf(const NodeGraph& graph, const QString& node, const QString& key)
{
    const NodeReference* ref = Inference::asReference(inputOf(graph, node, key));
    return ref ? *ref : NodeReference{};
}

} // namespace

TEST(TextToImageGraphBuilderTests, BaseGraphHasSevenNodes)
{
    const NodeGraph graph = TextToImageGraphBuilder::build(makeParameters());

    EXPECT_EQ(graph.size(), 7);
    EXPECT_EQ(graph.names(),
              (QStringList{Nodes::CheckpointLoader, Nodes::EmptyLatentImage, Nodes::Sampler, Nodes::PositiveClip,
                           Nodes::NegativeClip, Nodes::VaeDecoder, Nodes::SaveImage}));
    EXPECT_EQ(refOf(graph, Nodes::VaeDecoder, u"samples"_s), (NodeReference{u"Sampler"_s, 0}));
    EXPECT_TRUE(graph.validate().ok);
}

TEST(TextToImageGraphBuilderTests, BaseGraphWiring)
{
    const TextToImageParameters p = makeParameters();
    const NodeGraph graph = TextToImageGraphBuilder::build(p);

    EXPECT_EQ(graph.find(Nodes::Sampler)->classType, u"KSampler"_s);
    EXPECT_EQ(refOf(graph, Nodes::Sampler, u"model"_s), (NodeReference{u"CheckpointLoader"_s, 0}));
    EXPECT_EQ(refOf(graph, Nodes::Sampler, u"positive"_s), (NodeReference{u"PositiveCLIP"_s, 0}));
    EXPECT_EQ(refOf(graph, Nodes::Sampler, u"negative"_s), (NodeReference{u"NegativeCLIP"_s, 0}));
    EXPECT_EQ(refOf(graph, Nodes::Sampler, u"latent_image"_s), (NodeReference{u"EmptyLatentImage"_s, 0}));
    EXPECT_EQ(refOf(graph, Nodes::PositiveClip, u"clip"_s), (NodeReference{u"CheckpointLoader"_s, 1}));
    EXPECT_EQ(refOf(graph, Nodes::VaeDecoder, u"vae"_s), (NodeReference{u"CheckpointLoader"_s, 2}));
    EXPECT_EQ(refOf(graph, Nodes::SaveImage, u"images"_s), (NodeReference{u"VAEDecoder"_s, 0}));

    EXPECT_EQ(std::get<double>(inputOf(graph, Nodes::Sampler, u"denoise"_s)), 1.0);
    EXPECT_EQ(std::get<qint64>(inputOf(graph, Nodes::Sampler, u"seed"_s)), p.seed);
    EXPECT_EQ(std::get<qint64>(inputOf(graph, Nodes::EmptyLatentImage, u"width"_s)), 640);
    EXPECT_EQ(std::get<qint64>(inputOf(graph, Nodes::EmptyLatentImage, u"height"_s)), 448);
    EXPECT_EQ(std::get<QString>(inputOf(graph, Nodes::PositiveClip, u"text"_s)), p.positivePrompt);
    EXPECT_EQ(std::get<QString>(inputOf(graph, Nodes::NegativeClip, u"text"_s)), p.negativePrompt);
    EXPECT_EQ(std::get<QString>(inputOf(graph, Nodes::SaveImage, u"filename_prefix"_s)), u"Kiln-Inference"_s);
}

TEST(TextToImageGraphBuilderTests, HiresAddsTwoNodesAndRewiresDecoder)
{
    TextToImageParameters p = makeParameters();
    p.hiresEnabled = true;
    p.hires.scale = 1.5;
    p.hires.denoise = 0.45;
    p.hires.steps = 12;

    const NodeGraph hires = TextToImageGraphBuilder::build(p);
    EXPECT_EQ(hires.size(), 9);
    EXPECT_EQ(refOf(hires, Nodes::VaeDecoder, u"samples"_s), (NodeReference{u"Sampler2"_s, 0}));
    EXPECT_EQ(refOf(hires, Nodes::LatentUpscale, u"samples"_s), (NodeReference{u"Sampler"_s, 0}));
    EXPECT_EQ(refOf(hires, Nodes::HiresSampler, u"latent_image"_s), (NodeReference{u"LatentUpscale"_s, 0}));
    EXPECT_EQ(std::get<qint64>(inputOf(hires, Nodes::LatentUpscale, u"width"_s)), 960);
    EXPECT_EQ(std::get<qint64>(inputOf(hires, Nodes::LatentUpscale, u"height"_s)), 672);
    EXPECT_EQ(std::get<QString>(inputOf(hires, Nodes::LatentUpscale, u"crop"_s)), u"disabled"_s);
    EXPECT_EQ(std::get<double>(inputOf(hires, Nodes::HiresSampler, u"denoise"_s)), 0.45);
    EXPECT_EQ(std::get<qint64>(inputOf(hires, Nodes::HiresSampler, u"steps"_s)), 12);
    EXPECT_TRUE(hires.validate().ok);

    p.hiresEnabled = false;
    const NodeGraph base = TextToImageGraphBuilder::build(p);
    EXPECT_EQ(base.size(), 7);
    EXPECT_FALSE(base.contains(Nodes::HiresSampler));
    EXPECT_EQ(refOf(base, Nodes::VaeDecoder, u"samples"_s), (NodeReference{u"Sampler"_s, 0}));
}

TEST(TextToImageGraphBuilderTests, HiresSamplerFallsBackToFirstPassSampler)
{
    TextToImageParameters p = makeParameters();
    p.hiresEnabled = true;
    p.hires.samplerName.clear();

    const NodeGraph graph = TextToImageGraphBuilder::build(p);
    EXPECT_EQ(std::get<QString>(inputOf(graph, Nodes::HiresSampler, u"sampler_name"_s)), p.samplerName);

    p.hires.samplerName = u"dpmpp_2m"_s;
    const NodeGraph explicitSampler = TextToImageGraphBuilder::build(p);
    EXPECT_EQ(std::get<QString>(inputOf(explicitSampler, Nodes::HiresSampler, u"sampler_name"_s)), u"dpmpp_2m"_s);
}

TEST(TextToImageGraphBuilderTests, UnsetModelAndSamplerSerializeAsNull)
{
    TextToImageParameters p;
    const QJsonObject json = TextToImageGraphBuilder::build(p).toJson();

    EXPECT_TRUE(json.value("CheckpointLoader").toObject().value("inputs").toObject().value("ckpt_name").isNull());
    EXPECT_TRUE(json.value("Sampler").toObject().value("inputs").toObject().value("sampler_name").isNull());
}

TEST(TextToImageGraphBuilderTests, BuildIsDeterministic)
{
    const TextToImageParameters p = makeParameters();
    EXPECT_EQ(TextToImageGraphBuilder::build(p).toJson(), TextToImageGraphBuilder::build(p).toJson());
}

TEST(TextToImageParametersTests, JsonRestoresSavedValuesAndDefaults)
{
    TextToImageParameters p = makeParameters();
    p.seed = 9007199254740993LL;
    p.hiresEnabled = true;
    p.hires.samplerName = u"dpmpp_2m"_s;

    EXPECT_EQ(TextToImageParameters::fromJson(p.toJson()), p);

    const TextToImageParameters defaults = TextToImageParameters::fromJson(QJsonObject{{"steps", 30}});
    EXPECT_EQ(defaults.steps, 30);
    EXPECT_EQ(defaults.width, 512);
    EXPECT_EQ(defaults.scheduler, u"normal"_s);
    EXPECT_EQ(defaults.hires.upscaleMethod, u"nearest-exact"_s);
    EXPECT_DOUBLE_EQ(defaults.hires.scale, 1.5);
}
