// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/ComfyTask.hpp"
#include "inference/IInferenceClient.hpp"
#include "inference/NodeGraph.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QPointer>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <utility>

namespace Inference::Testing {

// Scriptable client: requests are recorded and answered by the test through the complete*() calls.
class FakeInferenceClient final : public IInferenceClient
{
public:
    struct PendingQueue {
        NodeGraph graph;
        Utils::Async::CancellationToken token;
        QueueCallback done;
    };

    struct PendingImages {
        QString promptId;
        Utils::Async::CancellationToken token;
        ImagesCallback done;
    };

    explicit FakeInferenceClient(QUrl baseUrl = QUrl(QStringLiteral("http://127.0.0.1:8188")),
                                 QString outputDir = {},
                                 QObject* parent = nullptr)
        : IInferenceClient(parent)
        , m_baseUrl(std::move(baseUrl))
        , m_outputDir(std::move(outputDir))
    {}

    void open() override
    {
        ++openCalls;
        if (failOpenWith.isEmpty()) {
            m_open = true;
            emit opened();
        } else {
            emit connectionError(failOpenWith);
        }
    }

    void close() override
    {
        if (!m_open)
            return;
        m_open = false;
        emit closed();
    }

    bool isOpen() const override { return m_open; }
    QUrl baseUrl() const override { return m_baseUrl; }
    QString outputImagesDir() const override { return m_outputDir; }

    void queuePrompt(const NodeGraph& graph,
                     const Utils::Async::CancellationToken& token,
                     QueueCallback done) override
    {
        queued.push_back({graph, token, std::move(done)});
    }

    void interrupt(int timeoutMs) override { interruptTimeouts.push_back(timeoutMs); }

    void fetchOutputImages(const QString& promptId,
                           const Utils::Async::CancellationToken& token,
                           ImagesCallback done) override
    {
        imageRequests.push_back({promptId, token, std::move(done)});
    }

    // Answers synchronously with the whole scripted /object_info document.
    void fetchObjectInfo(const QString& classType, ObjectInfoCallback done) override
    {
        objectInfoRequests.push_back(classType);
        done(objectInfo, ApiError::none());
    }

    // Accepts the oldest queued prompt and returns its task. `finishedEarly` hands over a task
    // whose completion arrived on the socket before the queue reply.
    ComfyTask* acceptPrompt(const QString& promptId, bool finishedEarly = false)
    {
        PendingQueue pending = queued.takeFirst();
        auto* task = new ComfyTask(promptId, this);
        if (finishedEarly)
            task->complete();
        lastTask = task;
        pending.done(task, ApiError::none());
        return task;
    }

    void rejectPrompt(const ApiError& error)
    {
        PendingQueue pending = queued.takeFirst();
        pending.done(nullptr, error);
    }

    void answerImages(const OutputImages& outputs)
    {
        PendingImages pending = imageRequests.takeFirst();
        pending.done(outputs, ApiError::none());
    }

    void failImages(const ApiError& error)
    {
        PendingImages pending = imageRequests.takeFirst();
        pending.done({}, error);
    }

    void sendPreview(const QImage& image) { emit previewImageReceived(image); }

    int previewReceivers() const { return receivers(SIGNAL(previewImageReceived(QImage))); }

    QVector<PendingQueue> queued;
    QVector<PendingImages> imageRequests;
    QVector<int> interruptTimeouts;
    QPointer<ComfyTask> lastTask;
    QJsonObject objectInfo;
    QStringList objectInfoRequests;
    QString failOpenWith;
    int openCalls = 0;

private:
    QUrl m_baseUrl;
    QString m_outputDir;
    bool m_open = false;
};

} // namespace Inference::Testing
