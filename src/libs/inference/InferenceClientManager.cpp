// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/InferenceClientManager.hpp"

#include "inference/ComfyClient.hpp"
#include "inference/ComfyProtocol.hpp"

#include <utility>

using namespace Qt::StringLiterals;

namespace Inference {

namespace {

struct OptionSource {
    QString classType;
    QString inputName;
    QStringList InferenceClientManager::* list;
    void (InferenceClientManager::*notify)();
};

} // namespace

InferenceClientManager::InferenceClientManager(QObject* parent)
    : QObject(parent)
    , m_factory([](const QUrl& baseUrl, const QString& outputImagesDir) -> std::unique_ptr<IInferenceClient> {
        return std::make_unique<ComfyClient>(baseUrl, outputImagesDir);
    })
{}

InferenceClientManager::~InferenceClientManager()
{
    releaseClient();
}

void InferenceClientManager::setClientFactory(ClientFactory factory)
{
    if (factory)
        m_factory = std::move(factory);
}

void InferenceClientManager::setOutputImagesDir(const QString& dir)
{
    m_outputImagesDir = dir;
}

QUrl InferenceClientManager::baseUrl() const
{
    return m_client ? m_client->baseUrl() : QUrl();
}

void InferenceClientManager::connectToHost(const QUrl& baseUrl)
{
    if (!baseUrl.isValid() || baseUrl.scheme().isEmpty()) {
        emit connectionFailed(u"Invalid backend address: %1"_s.arg(baseUrl.toString()));
        return;
    }

    releaseClient();

    std::unique_ptr<IInferenceClient> client = m_factory(baseUrl, m_outputImagesDir);
    if (!client) {
        emit connectionFailed(u"No client available for %1"_s.arg(baseUrl.toDisplayString()));
        return;
    }

    client->setParent(this);
    m_client = client.release();

    connect(m_client, &IInferenceClient::opened, this, [this]() {
        setConnecting(false);
        setConnected(true);
        refreshOptionLists();
    });
    connect(m_client, &IInferenceClient::closed, this, [this]() {
        setConnecting(false);
        setConnected(false);
    });
    connect(m_client, &IInferenceClient::connectionError, this, [this](const QString& message) {
        if (m_connecting) {
            setConnecting(false);
            emit connectionFailed(message);
        }
    });

    setConnecting(true);
    m_client->open();
}

void InferenceClientManager::disconnectFromHost()
{
    releaseClient();
    setConnecting(false);
    setConnected(false);
}

void InferenceClientManager::releaseClient()
{
    if (!m_client)
        return;

    IInferenceClient* client = m_client.data();
    m_client.clear();
    client->disconnect(this);
    client->close();
    client->deleteLater();
}

void InferenceClientManager::refreshOptionLists()
{
    if (!m_client)
        return;

    const OptionSource sources[] = {
        {u"CheckpointLoaderSimple"_s, u"ckpt_name"_s, &InferenceClientManager::m_models, &InferenceClientManager::modelsChanged},
        {u"KSampler"_s, u"sampler_name"_s, &InferenceClientManager::m_samplers, &InferenceClientManager::samplersChanged},
        {u"KSampler"_s, u"scheduler"_s, &InferenceClientManager::m_schedulers, &InferenceClientManager::schedulersChanged},
        {u"LatentUpscale"_s, u"upscale_method"_s, &InferenceClientManager::m_upscalers, &InferenceClientManager::upscalersChanged},
    };

    QPointer<IInferenceClient> requester = m_client;
    for (const OptionSource& source : sources) {
        m_client->fetchObjectInfo(source.classType,
                                  [this, requester, source](const QJsonObject& info, const ApiError& error) {
            if (requester != m_client)
                return;
            if (error.isError()) {
                qCWarning(inferencelog) << "Failed to list" << source.inputName << ":" << error.summary();
                return;
            }

            QStringList values = ComfyProtocol::parseObjectInfoChoices(info, source.classType, source.inputName);
            if (this->*source.list == values)
                return;
            this->*source.list = std::move(values);
            (this->*source.notify)();
        });
    }
}

void InferenceClientManager::setConnected(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    emit isConnectedChanged(m_connected);
}

void InferenceClientManager::setConnecting(bool connecting)
{
    if (m_connecting == connecting)
        return;
    m_connecting = connecting;
    emit isConnectingChanged(m_connecting);
}

} // namespace Inference
