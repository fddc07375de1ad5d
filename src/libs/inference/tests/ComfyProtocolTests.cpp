// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "inference/ComfyImage.hpp"
#include "inference/ComfyProtocol.hpp"
#include "inference/ComfyTask.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QJsonDocument>
#include <QtCore/QUrlQuery>
#include <QtCore/QtEndian>
#include <QtTest/QSignalSpy>

#include <memory>

using namespace Qt::StringLiterals;
namespace Protocol = Inference::ComfyProtocol;
using Inference::ComfyImage;
using Inference::ImageSource;

namespace {

QByteArray binaryFrame(quint32 event, quint32 format, const QByteArray& payload)
{
    QByteArray frame(8, '\0');
    qToBigEndian<quint32>(event, frame.data());
    qToBigEndian<quint32>(format, frame.data() + 4);
    return frame + payload;
}

} // namespace

TEST(ComfyProtocolTests, EndpointsJoinBasePath)
{
    const QUrl base(u"http://127.0.0.1:8188"_s);
    EXPECT_EQ(Protocol::endpoint(base, u"prompt"_s), QUrl(u"http://127.0.0.1:8188/prompt"_s));
    EXPECT_EQ(Protocol::endpoint(QUrl(u"https://host/comfy/"_s), u"history/abc"_s),
              QUrl(u"https://host/comfy/history/abc"_s));

    const QUrl ws = Protocol::webSocketUrl(QUrl(u"https://host/comfy"_s), u"client-1"_s);
    EXPECT_EQ(ws.scheme(), u"wss"_s);
    EXPECT_EQ(ws.path(), u"/comfy/ws"_s);
    EXPECT_EQ(QUrlQuery(ws).queryItemValue(u"clientId"_s), u"client-1"_s);

    EXPECT_EQ(Protocol::webSocketUrl(base, u"c"_s).scheme(), u"ws"_s);
}

TEST(ComfyProtocolTests, PromptBodyCarriesGraphAndClientId)
{
    Inference::NodeGraph graph;
    graph.add(Inference::ComfyNode(u"A"_s, u"Op"_s));

    const QJsonObject body = QJsonDocument::fromJson(Protocol::promptRequestBody(graph, u"cid"_s)).object();
    EXPECT_EQ(body.value("client_id").toString(), u"cid"_s);
    EXPECT_EQ(body.value("prompt").toObject().value("A").toObject().value("class_type").toString(), u"Op"_s);
}

TEST(ComfyProtocolTests, ParsesPromptId)
{
    QString error;
    EXPECT_EQ(Protocol::parsePromptId(R"({"prompt_id":"p-1","number":3})", &error), u"p-1"_s);
    EXPECT_TRUE(error.isEmpty());

    EXPECT_TRUE(Protocol::parsePromptId(R"({"number":3})", &error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
}

TEST(ComfyProtocolTests, ParsesHistoryOutputs)
{
    const QByteArray reply = R"({
        "p-1": {
            "outputs": {
                "SaveImage": {"images": [
                    {"filename": "Kiln-Inference_00001_.png", "subfolder": "", "type": "output"},
                    {"filename": "Kiln-Inference_00002_.png", "subfolder": "batch", "type": "output"}
                ]},
                "PreviewText": {"text": ["hello"]}
            }
        }
    })";

    QString error;
    const Protocol::OutputImages outputs = Protocol::parseHistory(reply, u"p-1"_s, &error);
    EXPECT_TRUE(error.isEmpty());
    ASSERT_TRUE(outputs.contains(u"SaveImage"_s));
    EXPECT_FALSE(outputs.contains(u"PreviewText"_s));

    const QVector<ComfyImage>& images = outputs.value(u"SaveImage"_s);
    ASSERT_EQ(images.size(), 2);
    EXPECT_EQ(images[1], (ComfyImage{u"Kiln-Inference_00002_.png"_s, u"batch"_s, u"output"_s}));

    Protocol::parseHistory(reply, u"other"_s, &error);
    EXPECT_FALSE(error.isEmpty());
}

TEST(ComfyProtocolTests, ParsesObjectInfoChoices)
{
    const QJsonObject info = QJsonDocument::fromJson(R"({
        "KSampler": {"input": {"required": {
            "sampler_name": [["euler", "dpmpp_2m"]],
            "steps": ["INT", {"default": 20}]
        }}}
    })").object();

    EXPECT_EQ(Protocol::parseObjectInfoChoices(info, u"KSampler"_s, u"sampler_name"_s),
              (QStringList{u"euler"_s, u"dpmpp_2m"_s}));
    EXPECT_TRUE(Protocol::parseObjectInfoChoices(info, u"KSampler"_s, u"steps"_s).isEmpty());
    EXPECT_TRUE(Protocol::parseObjectInfoChoices(info, u"Missing"_s, u"x"_s).isEmpty());
}

TEST(ComfyProtocolTests, ParsesTextFrames)
{
    using Type = Protocol::SocketEvent::Type;

    auto progress = Protocol::parseTextFrame(R"({"type":"progress","data":{"value":3,"max":20,"prompt_id":"p"}})");
    EXPECT_EQ(progress.type, Type::Progress);
    EXPECT_EQ(progress.value, 3);
    EXPECT_EQ(progress.maximum, 20);
    EXPECT_EQ(progress.promptId, u"p"_s);

    auto running = Protocol::parseTextFrame(R"({"type":"executing","data":{"node":"Sampler","prompt_id":"p"}})");
    EXPECT_EQ(running.type, Type::Executing);
    ASSERT_TRUE(running.node.has_value());
    EXPECT_EQ(*running.node, u"Sampler"_s);

    auto done = Protocol::parseTextFrame(R"({"type":"executing","data":{"node":null,"prompt_id":"p"}})");
    EXPECT_EQ(done.type, Type::Executing);
    EXPECT_FALSE(done.node.has_value());

    auto failed = Protocol::parseTextFrame(
        R"({"type":"execution_error","data":{"prompt_id":"p","node_type":"KSampler","exception_message":"OOM","exception_type":"RuntimeError"}})");
    EXPECT_EQ(failed.type, Type::ExecutionError);
    EXPECT_EQ(failed.errorMessage, u"KSampler: OOM (RuntimeError)"_s);

    EXPECT_EQ(Protocol::parseTextFrame(R"({"type":"crystools.monitor","data":{}})").type, Type::Unknown);

    QString error;
    Protocol::parseTextFrame("not json", &error);
    EXPECT_FALSE(error.isEmpty());
}

TEST(ComfyProtocolTests, ParsesBinaryPreviewFrames)
{
    QString error;
    const auto png = Protocol::parseBinaryFrame(binaryFrame(1, 2, "PNGDATA"), &error);
    ASSERT_TRUE(png.has_value());
    EXPECT_EQ(png->format, Protocol::PreviewFormat::Png);
    EXPECT_STREQ(png->formatName(), "PNG");
    EXPECT_EQ(png->imageBytes, QByteArray("PNGDATA"));

    EXPECT_FALSE(Protocol::parseBinaryFrame(binaryFrame(2, 1, "x"), &error).has_value());
    EXPECT_TRUE(error.isEmpty());

    EXPECT_FALSE(Protocol::parseBinaryFrame(binaryFrame(1, 9, "x"), &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(Protocol::parseBinaryFrame(QByteArray(3, '\1'), &error).has_value());
    EXPECT_FALSE(error.isEmpty());
}

TEST(ComfyImageTests, ResolvesFilePathAndUrl)
{
    const ComfyImage image{u"out 1.png"_s, u"sub"_s, u"output"_s};

    EXPECT_EQ(image.toFilePath(u"/data/output"_s), u"/data/output/sub/out 1.png"_s);
    EXPECT_EQ(ComfyImage{u"a.png"_s}.toFilePath(u"/data/output"_s), u"/data/output/a.png"_s);

    const QUrl url = image.toUrl(QUrl(u"http://127.0.0.1:8188"_s));
    EXPECT_EQ(url.path(), u"/view"_s);
    const QUrlQuery query(url);
    EXPECT_EQ(query.queryItemValue(u"filename"_s, QUrl::FullyDecoded), u"out 1.png"_s);
    EXPECT_EQ(query.queryItemValue(u"subfolder"_s), u"sub"_s);
    EXPECT_EQ(query.queryItemValue(u"type"_s), u"output"_s);

    EXPECT_EQ(ImageSource::fromUrl(url).fileName(), u"out 1.png"_s);
    EXPECT_EQ(ImageSource::fromLocalFile(u"/data/output/sub/out 1.png"_s).fileName(), u"out 1.png"_s);
    EXPECT_TRUE(ImageSource::fromLocalFile(u"/x.png"_s).isLocal());
    EXPECT_FALSE(ImageSource().isValid());
}

TEST(ComfyTaskTests, ReportsProgressAndCompletesOnce)
{
    std::unique_ptr<QCoreApplication> local;
    if (!QCoreApplication::instance()) {
        static int argc = 1;
        static char arg0[] = "kiln-inference-tests";
        static char* argv[] = {arg0, nullptr};
        local = std::make_unique<QCoreApplication>(argc, argv);
    }

    Inference::ComfyTask task(u"p"_s);
    QSignalSpy progress(&task, &Inference::ComfyTask::progressUpdated);
    QSignalSpy completed(&task, &Inference::ComfyTask::completed);
    QSignalSpy failed(&task, &Inference::ComfyTask::failed);

    task.setRunningNode(u"Sampler"_s);
    task.reportProgress(4, 20);
    ASSERT_EQ(progress.count(), 1);
    const auto update = progress.at(0).at(0).value<Inference::ProgressUpdate>();
    EXPECT_EQ(update.text(), u"(4 / 20) Sampler"_s);
    EXPECT_EQ(update.promptId, u"p"_s);

    task.complete();
    task.fail(u"late"_s);
    task.reportProgress(5, 20);
    EXPECT_EQ(completed.count(), 1);
    EXPECT_EQ(failed.count(), 0);
    EXPECT_EQ(progress.count(), 1);
    EXPECT_EQ(task.state(), Inference::ComfyTask::State::Completed);
}
