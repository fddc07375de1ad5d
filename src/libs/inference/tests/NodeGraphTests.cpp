// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "inference/NodeGraph.hpp"

#include <QtCore/QJsonArray>

using namespace Qt::StringLiterals;
using Inference::ComfyNode;
using Inference::NodeGraph;
using Inference::NodeReference;

namespace {

ComfyNode node(const QString& name, const QString& classType = u"Op"_s)
{
    return ComfyNode(name, classType);
}

} // namespace

TEST(NodeGraphTests, SerializesToPromptObject)
{
    NodeGraph graph;
    ComfyNode loader = node(u"Loader"_s, u"CheckpointLoaderSimple"_s);
    loader.set(u"ckpt_name"_s, std::monostate{});
    graph.add(loader);

    ComfyNode sampler = node(u"Sampler"_s, u"KSampler"_s);
    sampler.set(u"steps"_s, qint64(20))
        .set(u"cfg"_s, 7.5)
        .set(u"scheduler"_s, u"normal"_s)
        .set(u"add_noise"_s, true)
        .set(u"model"_s, NodeReference{u"Loader"_s, 0});
    graph.add(sampler);

    const QJsonObject json = graph.toJson();
    ASSERT_EQ(json.size(), 2);

    const QJsonObject s = json.value("Sampler").toObject();
    EXPECT_EQ(s.value("class_type").toString(), u"KSampler"_s);

    const QJsonObject inputs = s.value("inputs").toObject();
    EXPECT_EQ(inputs.value("steps").toInteger(), 20);
    EXPECT_DOUBLE_EQ(inputs.value("cfg").toDouble(), 7.5);
    EXPECT_EQ(inputs.value("scheduler").toString(), u"normal"_s);
    EXPECT_TRUE(inputs.value("add_noise").toBool());
    EXPECT_EQ(inputs.value("model").toArray(), (QJsonArray{u"Loader"_s, 0}));

    EXPECT_TRUE(json.value("Loader").toObject().value("inputs").toObject().value("ckpt_name").isNull());
}

TEST(NodeGraphTests, SetReplacesInputInPlace)
{
    ComfyNode n = node(u"A"_s);
    n.set(u"x"_s, qint64(1)).set(u"y"_s, qint64(2)).set(u"x"_s, qint64(3));

    ASSERT_EQ(n.inputs.size(), 2);
    EXPECT_EQ(n.inputs[0].first, u"x"_s);
    EXPECT_EQ(std::get<qint64>(n.inputs[0].second), 3);
}

TEST(NodeGraphTests, AddingExistingNameReplacesNode)
{
    NodeGraph graph;
    graph.add(node(u"A"_s, u"First"_s));
    graph.add(node(u"B"_s));
    graph.add(node(u"A"_s, u"Second"_s));

    EXPECT_EQ(graph.size(), 2);
    EXPECT_EQ(graph.names(), (QStringList{u"A"_s, u"B"_s}));
    EXPECT_EQ(graph.find(u"A"_s)->classType, u"Second"_s);

    EXPECT_TRUE(graph.remove(u"A"_s));
    EXPECT_FALSE(graph.contains(u"A"_s));
    EXPECT_EQ(graph.find(u"B"_s)->name, u"B"_s);
}

TEST(NodeGraphTests, ValidAcyclicGraphPasses)
{
    NodeGraph graph;
    graph.add(node(u"A"_s));
    ComfyNode b = node(u"B"_s);
    b.set(u"in"_s, NodeReference{u"A"_s, 0});
    graph.add(b);
    ComfyNode c = node(u"C"_s);
    c.set(u"left"_s, NodeReference{u"A"_s, 1}).set(u"right"_s, NodeReference{u"B"_s, 0});
    graph.add(c);

    const Utils::Result r = graph.validate();
    EXPECT_TRUE(r.ok) << r.message().toStdString();
}

TEST(NodeGraphTests, ValidateRejectsDanglingReferenceAndNegativeSlot)
{
    NodeGraph graph;
    ComfyNode a = node(u"A"_s);
    a.set(u"in"_s, NodeReference{u"Missing"_s, 0});
    graph.add(a);
    ComfyNode b = node(u"B"_s);
    b.set(u"in"_s, NodeReference{u"A"_s, -1});
    graph.add(b);

    const Utils::Result r = graph.validate();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 2);
    EXPECT_TRUE(r.message().contains(u"Missing"_s));
}

TEST(NodeGraphTests, ValidateRejectsCycles)
{
    NodeGraph graph;
    ComfyNode a = node(u"A"_s);
    a.set(u"in"_s, NodeReference{u"C"_s, 0});
    ComfyNode b = node(u"B"_s);
    b.set(u"in"_s, NodeReference{u"A"_s, 0});
    ComfyNode c = node(u"C"_s);
    c.set(u"in"_s, NodeReference{u"B"_s, 0});
    graph.add(a);
    graph.add(b);
    graph.add(c);
    graph.add(node(u"Free"_s));

    const Utils::Result r = graph.validate();
    ASSERT_FALSE(r.ok);
    EXPECT_TRUE(r.message().contains(u"cycle"_s));
    EXPECT_FALSE(r.message().contains(u"Free"_s));

    NodeGraph self;
    ComfyNode loop = node(u"Loop"_s);
    loop.set(u"in"_s, NodeReference{u"Loop"_s, 0});
    self.add(loop);
    EXPECT_FALSE(self.validate().ok);
}
