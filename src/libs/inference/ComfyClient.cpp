// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/ComfyClient.hpp"

#include "inference/ComfyProtocol.hpp"
#include "inference/NodeGraph.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QUuid>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <memory>
#include <utility>

using namespace Qt::StringLiterals;

namespace Inference {

ComfyClient::ComfyClient(QUrl baseUrl, QString outputImagesDir, QObject* parent)
    : IInferenceClient(parent)
    , m_baseUrl(std::move(baseUrl))
    , m_outputImagesDir(std::move(outputImagesDir))
    , m_clientId(QUuid::createUuid().toString(QUuid::WithoutBraces))
{
    connect(&m_socket, &QWebSocket::connected, this, [this]() {
        qCInfo(inferencelog) << "Connected to" << m_baseUrl.toDisplayString();
        emit opened();
    });
    connect(&m_socket, &QWebSocket::disconnected, this, [this]() {
        // Prompts still running can no longer report completion.
        m_prompts.failAll(u"Connection to the backend was lost."_s);
        emit closed();
    });
    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        qCWarning(inferencelog) << "WebSocket error:" << m_socket.errorString();
        emit connectionError(m_socket.errorString());
    });
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &ComfyClient::handleTextMessage);
    connect(&m_socket, &QWebSocket::binaryMessageReceived, this, &ComfyClient::handleBinaryMessage);
}

ComfyClient::~ComfyClient()
{
    m_socket.disconnect(this);
    m_socket.abort();
    m_prompts.failAll(u"Connection to the backend was closed."_s);
}

void ComfyClient::open()
{
    if (m_socket.state() != QAbstractSocket::UnconnectedState)
        return;
    m_socket.open(ComfyProtocol::webSocketUrl(m_baseUrl, m_clientId));
}

void ComfyClient::close()
{
    // The close handshake may outlive this client; settle running prompts now.
    m_prompts.failAll(u"Connection to the backend was closed."_s);
    m_socket.close();
}

bool ComfyClient::isOpen() const
{
    return m_socket.state() == QAbstractSocket::ConnectedState;
}

QNetworkRequest ComfyClient::makeRequest(const QString& relativePath, int timeoutMs) const
{
    QNetworkRequest request(ComfyProtocol::endpoint(m_baseUrl, relativePath));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/json"));
    request.setTransferTimeout(timeoutMs);
    return request;
}

void ComfyClient::track(QNetworkReply* reply, const Utils::Async::CancellationToken& token, ReplyHandler handler)
{
    auto cancelRegistration = std::make_shared<Utils::Subscription>();

    connect(reply, &QNetworkReply::finished, this,
            [reply, token, cancelRegistration, handler = std::move(handler)]() {
        cancelRegistration->reset();
        reply->deleteLater();

        const QByteArray body = reply->readAll();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QNetworkReply::NetworkError code = reply->error();

        if (code == QNetworkReply::NoError) {
            handler(body, ApiError::none());
            return;
        }

        if (code == QNetworkReply::OperationCanceledError) {
            // Aborted by us, or by the transfer timeout.
            const auto kind = token.isCancellationRequested() ? ApiError::Kind::Cancelled : ApiError::Kind::Timeout;
            handler({}, ApiError::make(kind, reply->errorString()));
            return;
        }

        if (status >= 400) {
            handler({}, ApiError::make(ApiError::Kind::Rejected, reply->errorString(), status, body));
            return;
        }

        handler({}, ApiError::make(ApiError::Kind::Network, reply->errorString(), status, body));
    });

    QPointer<QNetworkReply> guard(reply);
    *cancelRegistration = token.onCancelled([guard]() {
        if (guard && guard->isRunning())
            guard->abort();
    });
}

void ComfyClient::queuePrompt(const NodeGraph& graph,
                              const Utils::Async::CancellationToken& token,
                              QueueCallback done)
{
    QNetworkReply* reply = m_network.post(makeRequest(u"prompt"_s, kRequestTimeoutMs),
                                          ComfyProtocol::promptRequestBody(graph, m_clientId));

    track(reply, token, [this, done = std::move(done)](const QByteArray& body, const ApiError& error) {
        if (error.isError()) {
            if (error.kind == ApiError::Kind::Rejected)
                qCWarning(inferencelog) << "Prompt rejected:" << error.summary() << body;
            done(nullptr, error);
            return;
        }

        QString parseError;
        const QString promptId = ComfyProtocol::parsePromptId(body, &parseError);
        if (promptId.isEmpty()) {
            done(nullptr, ApiError::make(ApiError::Kind::InvalidResponse, parseError, 200, body));
            return;
        }

        ComfyTask* task = m_prompts.createTask(promptId, this);
        qCDebug(inferencelog) << "Queued prompt" << promptId;
        done(task, ApiError::none());
    });
}

void ComfyClient::interrupt(int timeoutMs)
{
    QNetworkReply* reply = m_network.post(makeRequest(u"interrupt"_s, timeoutMs), QByteArray());
    connect(reply, &QNetworkReply::finished, this, [reply]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError)
            qCWarning(inferencelog) << "Interrupt request failed:" << reply->errorString();
    });
}

void ComfyClient::fetchOutputImages(const QString& promptId,
                                    const Utils::Async::CancellationToken& token,
                                    ImagesCallback done)
{
    QNetworkReply* reply = m_network.get(makeRequest(u"history/"_s + promptId, kRequestTimeoutMs));

    track(reply, token, [promptId, done = std::move(done)](const QByteArray& body, const ApiError& error) {
        if (error.isError()) {
            done({}, error);
            return;
        }

        QString parseError;
        const OutputImages outputs = ComfyProtocol::parseHistory(body, promptId, &parseError);
        if (!parseError.isEmpty()) {
            done({}, ApiError::make(ApiError::Kind::InvalidResponse, parseError, 200, body));
            return;
        }
        done(outputs, ApiError::none());
    });
}

void ComfyClient::fetchObjectInfo(const QString& classType, ObjectInfoCallback done)
{
    QNetworkReply* reply = m_network.get(makeRequest(u"object_info/"_s + classType, kRequestTimeoutMs));

    track(reply, Utils::Async::CancellationToken::none(),
          [classType, done = std::move(done)](const QByteArray& body, const ApiError& error) {
        if (error.isError()) {
            done({}, error);
            return;
        }

        QString parseError;
        const QJsonObject info = Utils::JsonFileUtils::parseObject(body, u"/object_info/"_s + classType, &parseError);
        if (!parseError.isEmpty()) {
            done({}, ApiError::make(ApiError::Kind::InvalidResponse, parseError, 200, body));
            return;
        }
        done(info, ApiError::none());
    });
}

void ComfyClient::handleTextMessage(const QString& message)
{
    QString error;
    const ComfyProtocol::SocketEvent event = ComfyProtocol::parseTextFrame(message.toUtf8(), &error);
    if (!error.isEmpty()) {
        qCWarning(inferencelog) << "Ignoring malformed WebSocket message:" << error;
        return;
    }
    m_prompts.dispatch(event);
}

void ComfyClient::handleBinaryMessage(const QByteArray& message)
{
    QString error;
    const auto frame = ComfyProtocol::parseBinaryFrame(message, &error);
    if (!frame) {
        if (!error.isEmpty())
            qCWarning(inferencelog) << "Ignoring binary WebSocket message:" << error;
        return;
    }

    const QImage image = QImage::fromData(frame->imageBytes, frame->formatName());
    if (image.isNull()) {
        qCWarning(inferencelog) << "Failed to decode preview image";
        return;
    }
    emit previewImageReceived(image);
}

} // namespace Inference
