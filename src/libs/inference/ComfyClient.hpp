// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/ComfyTask.hpp"
#include "inference/IInferenceClient.hpp"
#include "inference/InferenceGlobal.hpp"
#include "inference/PromptTracker.hpp"

#include <QtNetwork/QNetworkAccessManager>
#include <QtWebSockets/QWebSocket>

#include <functional>

class QNetworkReply;
class QNetworkRequest;

namespace Inference {

class INFERENCE_EXPORT ComfyClient final : public IInferenceClient
{
    Q_OBJECT

public:
    static constexpr int kRequestTimeoutMs = 30000;

    ComfyClient(QUrl baseUrl, QString outputImagesDir, QObject* parent = nullptr);
    ~ComfyClient() override;

    void open() override;
    void close() override;
    bool isOpen() const override;

    QUrl baseUrl() const override { return m_baseUrl; }
    QString outputImagesDir() const override { return m_outputImagesDir; }
    QString clientId() const { return m_clientId; }

    void queuePrompt(const NodeGraph& graph,
                     const Utils::Async::CancellationToken& token,
                     QueueCallback done) override;
    void interrupt(int timeoutMs) override;
    void fetchOutputImages(const QString& promptId,
                           const Utils::Async::CancellationToken& token,
                           ImagesCallback done) override;
    void fetchObjectInfo(const QString& classType, ObjectInfoCallback done) override;

private:
    using ReplyHandler = std::function<void(const QByteArray& body, const ApiError& error)>;

    QNetworkRequest makeRequest(const QString& relativePath, int timeoutMs) const;
    void track(QNetworkReply* reply, const Utils::Async::CancellationToken& token, ReplyHandler handler);

    void handleTextMessage(const QString& message);
    void handleBinaryMessage(const QByteArray& message);

    QUrl m_baseUrl;
    QString m_outputImagesDir;
    QString m_clientId;

    QNetworkAccessManager m_network;
    QWebSocket m_socket;
    PromptTracker m_prompts;
};

} // namespace Inference
