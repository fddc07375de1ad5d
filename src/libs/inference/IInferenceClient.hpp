// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/ApiError.hpp"
#include "inference/ComfyImage.hpp"
#include "inference/InferenceGlobal.hpp"

#include <utils/async/Cancellation.hpp>

#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QVector>
#include <QtGui/QImage>

#include <functional>

namespace Inference {

class ComfyTask;
class NodeGraph;

// Connection to a node-graph generation backend. Every callback runs on the client's thread,
// exactly once, unless the client is destroyed first.
class INFERENCE_EXPORT IInferenceClient : public QObject
{
    Q_OBJECT

public:
    using OutputImages = QHash<QString, QVector<ComfyImage>>;

    // On success `task` is non-null and owned by the client until the caller disposes of it.
    using QueueCallback = std::function<void(ComfyTask* task, const ApiError& error)>;
    using ImagesCallback = std::function<void(const OutputImages& outputs, const ApiError& error)>;
    using ObjectInfoCallback = std::function<void(const QJsonObject& info, const ApiError& error)>;

    explicit IInferenceClient(QObject* parent = nullptr)
        : QObject(parent)
    {}
    ~IInferenceClient() override = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual QUrl baseUrl() const = 0;

    // Where the backend writes its outputs on this machine; empty when it runs elsewhere.
    virtual QString outputImagesDir() const = 0;

    virtual void queuePrompt(const NodeGraph& graph,
                             const Utils::Async::CancellationToken& token,
                             QueueCallback done) = 0;

    // Best effort: no completion is reported and failures are only logged.
    virtual void interrupt(int timeoutMs) = 0;

    virtual void fetchOutputImages(const QString& promptId,
                                   const Utils::Async::CancellationToken& token,
                                   ImagesCallback done) = 0;

    virtual void fetchObjectInfo(const QString& classType, ObjectInfoCallback done) = 0;

signals:
    void opened();
    void closed();
    void connectionError(const QString& message);
    void previewImageReceived(const QImage& image);
};

} // namespace Inference
