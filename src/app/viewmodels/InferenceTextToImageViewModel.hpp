// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <inference/ApiError.hpp>
#include <inference/ComfyImage.hpp>
#include <inference/IInferenceClient.hpp>
#include <inference/TextToImageParameters.hpp>
#include <utils/Environment.hpp>
#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtGui/QImage>

namespace Inference {
class ComfyTask;
class InferenceClientManager;
struct ProgressUpdate;
} // namespace Inference

namespace Kiln::Services {
class INotificationService;
}

namespace Kiln::Models {
class ImageGalleryModel;
}

namespace Kiln::ViewModels {

class GenerationRun;

class APP_EXPORT InferenceTextToImageViewModel final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool isGenerating READ isGenerating NOTIFY isGeneratingChanged)
    Q_PROPERTY(int progressValue READ progressValue NOTIFY progressChanged)
    Q_PROPERTY(int progressMaximum READ progressMaximum NOTIFY progressChanged)
    Q_PROPERTY(QString progressText READ progressText NOTIFY progressChanged)
    Q_PROPERTY(QImage previewImage READ previewImage NOTIFY previewImageChanged)

public:
    static constexpr int kInterruptTimeoutMs = 5000;
    static inline const QString kStateName = QStringLiteral("inference-text-to-image");

    InferenceTextToImageViewModel(Inference::InferenceClientManager* clientManager,
                                  Services::INotificationService* notifications,
                                  QObject* parent = nullptr);
    ~InferenceTextToImageViewModel() override;

    Inference::InferenceClientManager* clientManager() const { return m_clientManager.data(); }
    Models::ImageGalleryModel* gallery() const { return m_gallery; }

    const Inference::TextToImageParameters& parameters() const noexcept { return m_parameters; }
    void setParameters(const Inference::TextToImageParameters& parameters);

    bool isGenerating() const noexcept { return m_run != nullptr; }
    int progressValue() const noexcept { return m_progressValue; }
    int progressMaximum() const noexcept { return m_progressMaximum; }
    QString progressText() const { return m_progressText; }
    QImage previewImage() const { return m_previewImage; }

    // Parameters are stored as a JSON state document; a missing document keeps the defaults.
    void loadState(const Utils::Environment& env);
    Utils::Result saveState(const Utils::Environment& env) const;

public slots:
    void generateImage();
    void cancelGeneration();

signals:
    void parametersChanged();
    void isGeneratingChanged(bool generating);
    void progressChanged();
    void previewImageChanged();

    // The backend refused the request; `error` carries its status and response body.
    void apiErrorRaised(const QString& title, const Inference::ApiError& error);
    void generationFailed(const QString& message);
    void generationFinished();

private:
    void onPromptQueued(Inference::ComfyTask* task, const Inference::ApiError& error);
    void onProgress(const Inference::ProgressUpdate& update);
    void onTaskCompleted();
    void onTaskFailed(const QString& message);
    void onOutputs(const Inference::IInferenceClient::OutputImages& outputs, const Inference::ApiError& error);

    void finishRun();
    void finishCancelled();
    void finishFailed(const QString& message);

    void setProgress(int value, int maximum, const QString& text);
    void setPreviewImage(const QImage& image);
    bool runIsLive(const QPointer<GenerationRun>& run) const;

    QPointer<Inference::InferenceClientManager> m_clientManager;
    Services::INotificationService* m_notifications = nullptr;
    Models::ImageGalleryModel* m_gallery = nullptr;

    Inference::TextToImageParameters m_parameters;

    GenerationRun* m_run = nullptr;
    QPointer<Inference::IInferenceClient> m_runClient;

    int m_progressValue = 0;
    int m_progressMaximum = 0;
    QString m_progressText;
    QImage m_previewImage;
};

} // namespace Kiln::ViewModels
