// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/IInferenceClient.hpp"
#include "inference/InferenceGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QStringList>
#include <QtCore/QUrl>

#include <functional>
#include <memory>

namespace Inference {

// Owns the active backend client and the option lists (models, samplers, ...) it advertises.
class INFERENCE_EXPORT InferenceClientManager final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool isConnected READ isConnected NOTIFY isConnectedChanged)
    Q_PROPERTY(bool isConnecting READ isConnecting NOTIFY isConnectingChanged)
    Q_PROPERTY(QStringList models READ models NOTIFY modelsChanged)
    Q_PROPERTY(QStringList samplers READ samplers NOTIFY samplersChanged)
    Q_PROPERTY(QStringList schedulers READ schedulers NOTIFY schedulersChanged)
    Q_PROPERTY(QStringList upscalers READ upscalers NOTIFY upscalersChanged)

public:
    using ClientFactory =
        std::function<std::unique_ptr<IInferenceClient>(const QUrl& baseUrl, const QString& outputImagesDir)>;

    explicit InferenceClientManager(QObject* parent = nullptr);
    ~InferenceClientManager() override;

    // Replaces the factory used by connectToHost(); the default creates a ComfyClient.
    void setClientFactory(ClientFactory factory);

    void setOutputImagesDir(const QString& dir);
    QString outputImagesDir() const { return m_outputImagesDir; }

    void connectToHost(const QUrl& baseUrl);
    void disconnectFromHost();

    IInferenceClient* client() const { return m_client.data(); }
    QUrl baseUrl() const;

    bool isConnected() const noexcept { return m_connected; }
    bool isConnecting() const noexcept { return m_connecting; }

    QStringList models() const { return m_models; }
    QStringList samplers() const { return m_samplers; }
    QStringList schedulers() const { return m_schedulers; }
    QStringList upscalers() const { return m_upscalers; }

    void refreshOptionLists();

signals:
    void isConnectedChanged(bool connected);
    void isConnectingChanged(bool connecting);
    void connectionFailed(const QString& message);
    void modelsChanged();
    void samplersChanged();
    void schedulersChanged();
    void upscalersChanged();

private:
    void setConnected(bool connected);
    void setConnecting(bool connecting);
    void releaseClient();

    ClientFactory m_factory;
    QString m_outputImagesDir;
    QPointer<IInferenceClient> m_client;
    bool m_connected = false;
    bool m_connecting = false;

    QStringList m_models;
    QStringList m_samplers;
    QStringList m_schedulers;
    QStringList m_upscalers;
};

} // namespace Inference
