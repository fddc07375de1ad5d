// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/viewmodels/InferenceTextToImageViewModel.hpp"

#include "app/models/ImageGalleryModel.hpp"
#include "app/services/INotificationService.hpp"
#include "app/viewmodels/GenerationRun.hpp"

#include <inference/ComfyTask.hpp>
#include <inference/ImageGrid.hpp>
#include <inference/InferenceClientManager.hpp>
#include <inference/NodeGraph.hpp>
#include <inference/TextToImageGraphBuilder.hpp>
#include <utils/async/AsyncTask.hpp>

#include <QtCore/QDir>
#include <QtCore/QRandomGenerator>

#include <limits>
#include <utility>

using namespace Qt::StringLiterals;

namespace Kiln::ViewModels {

using Inference::ApiError;
using Inference::ComfyTask;
using Inference::IInferenceClient;
using Inference::ImageSource;

InferenceTextToImageViewModel::InferenceTextToImageViewModel(Inference::InferenceClientManager* clientManager,
                                                             Services::INotificationService* notifications,
                                                             QObject* parent)
    : QObject(parent)
    , m_clientManager(clientManager)
    , m_notifications(notifications)
    , m_gallery(new Models::ImageGalleryModel(this))
{}

InferenceTextToImageViewModel::~InferenceTextToImageViewModel()
{
    if (m_run)
        m_run->end();
}

void InferenceTextToImageViewModel::setParameters(const Inference::TextToImageParameters& parameters)
{
    if (parameters == m_parameters)
        return;
    m_parameters = parameters;
    emit parametersChanged();
}

void InferenceTextToImageViewModel::loadState(const Utils::Environment& env)
{
    const Utils::DocumentLoadResult loaded = env.loadState(kStateName);
    if (loaded.status == Utils::DocumentLoadResult::Status::Corrupt) {
        qCWarning(applog) << "Ignoring unreadable generation parameters:" << loaded.error;
        return;
    }
    if (loaded.status != Utils::DocumentLoadResult::Status::Ok)
        return;

    setParameters(Inference::TextToImageParameters::fromJson(loaded.object));
}

Utils::Result InferenceTextToImageViewModel::saveState(const Utils::Environment& env) const
{
    return env.saveState(kStateName, m_parameters.toJson());
}

void InferenceTextToImageViewModel::generateImage()
{
    if (m_run) {
        qCDebug(applog) << "Generation already in progress";
        return;
    }

    IInferenceClient* client = m_clientManager ? m_clientManager->client() : nullptr;
    if (!client || !m_clientManager->isConnected()) {
        if (m_notifications) {
            m_notifications->show(u"Client not connected"_s, u"Please connect first"_s,
                                  Services::INotificationService::Severity::Warning);
        }
        return;
    }

    if (m_parameters.randomizeSeed) {
        m_parameters.seed = QRandomGenerator::global()->bounded(
            qint64(0), qint64(std::numeric_limits<quint32>::max()));
        emit parametersChanged();
    }

    const Inference::NodeGraph graph = Inference::TextToImageGraphBuilder::build(m_parameters);
    if (const Utils::Result valid = graph.validate(); !valid) {
        qCCritical(applog) << "Refusing to queue an invalid graph:" << valid.message();
        emit generationFailed(valid.message());
        return;
    }

    m_run = new GenerationRun(this);
    m_runClient = client;
    const QPointer<GenerationRun> run(m_run);
    emit isGeneratingChanged(true);

    // Previews may arrive before the queue request returns.
    m_run->setPreviewSubscription(Utils::Subscription::fromConnection(
        connect(client, &IInferenceClient::previewImageReceived, this, [this, run](const QImage& image) {
            if (runIsLive(run))
                setPreviewImage(image);
        })));

    // A client torn down mid-run takes its tasks with it without reporting them.
    m_run->setClientSubscription(Utils::Subscription::fromConnection(
        connect(client, &QObject::destroyed, this, [this, run]() {
            if (runIsLive(run))
                finishFailed(u"Connection to the backend was lost."_s);
        })));

    const QPointer<IInferenceClient> clientGuard(client);
    m_run->setCancelRegistration(m_run->token().onCancelled([clientGuard]() {
        if (clientGuard)
            clientGuard->interrupt(kInterruptTimeoutMs);
    }));

    client->queuePrompt(graph, m_run->token(), [this, run](ComfyTask* task, const ApiError& error) {
        if (!runIsLive(run)) {
            if (task)
                task->deleteLater();
            return;
        }
        onPromptQueued(task, error);
    });
}

void InferenceTextToImageViewModel::cancelGeneration()
{
    if (!m_run)
        return;
    m_run->cancel();
    finishCancelled();
}

void InferenceTextToImageViewModel::onPromptQueued(ComfyTask* task, const ApiError& error)
{
    if (error.isError()) {
        if (error.isCancelled() || m_run->isCancellationRequested()) {
            finishCancelled();
            return;
        }
        if (error.kind == ApiError::Kind::Rejected) {
            qCWarning(applog) << "Prompt rejected by backend:" << error.summary();
            finishRun();
            emit apiErrorRaised(u"API Error"_s, error);
            return;
        }
        finishFailed(error.summary());
        return;
    }

    if (!task) {
        finishFailed(u"The backend accepted the prompt without a task."_s);
        return;
    }

    m_run->setTask(task);
    m_run->setPhase(GenerationRun::Phase::Running);

    const QPointer<GenerationRun> run(m_run);
    m_run->addTaskSubscription(Utils::Subscription::fromConnection(
        connect(task, &ComfyTask::progressUpdated, this, [this, run](const Inference::ProgressUpdate& update) {
            if (runIsLive(run))
                onProgress(update);
        })));
    m_run->addTaskSubscription(Utils::Subscription::fromConnection(
        connect(task, &ComfyTask::completed, this, [this, run]() {
            if (runIsLive(run))
                onTaskCompleted();
        })));
    m_run->addTaskSubscription(Utils::Subscription::fromConnection(
        connect(task, &ComfyTask::failed, this, [this, run](const QString& message) {
            if (runIsLive(run))
                onTaskFailed(message);
        })));
    m_run->addTaskSubscription(Utils::Subscription::fromConnection(
        connect(task, &QObject::destroyed, this, [this, run]() {
            if (runIsLive(run) && run->phase() == GenerationRun::Phase::Running)
                finishFailed(u"The backend dropped the running prompt."_s);
        })));

    if (task->state() == ComfyTask::State::Completed)
        onTaskCompleted();
    else if (task->state() == ComfyTask::State::Failed)
        onTaskFailed(task->errorMessage());
}

void InferenceTextToImageViewModel::onProgress(const Inference::ProgressUpdate& update)
{
    setProgress(update.value, update.maximum, update.text());
}

void InferenceTextToImageViewModel::onTaskCompleted()
{
    if (m_run->phase() != GenerationRun::Phase::Running)
        return;

    IInferenceClient* client = m_runClient.data();
    if (!client) {
        finishFailed(u"Connection to the backend was lost."_s);
        return;
    }

    const QString promptId = m_run->task() ? m_run->task()->id() : QString();
    m_run->setPhase(GenerationRun::Phase::FetchingOutputs);

    const QPointer<GenerationRun> run(m_run);
    client->fetchOutputImages(promptId, m_run->token(),
                              [this, run](const IInferenceClient::OutputImages& outputs, const ApiError& error) {
        if (runIsLive(run))
            onOutputs(outputs, error);
    });
}

void InferenceTextToImageViewModel::onTaskFailed(const QString& message)
{
    if (m_run->isCancellationRequested()) {
        finishCancelled();
        return;
    }
    finishFailed(message);
}

void InferenceTextToImageViewModel::onOutputs(const IInferenceClient::OutputImages& outputs, const ApiError& error)
{
    if (error.isError()) {
        if (error.isCancelled() || m_run->isCancellationRequested())
            finishCancelled();
        else
            finishFailed(u"Could not fetch output images: %1"_s.arg(error.summary()));
        return;
    }

    m_gallery->clear();

    const QVector<Inference::ComfyImage> images = outputs.value(Inference::TextToImageNodes::SaveImage);
    if (images.isEmpty()) {
        qCInfo(applog) << "Prompt finished without saved images";
        finishRun();
        return;
    }

    const QString outputDir = m_runClient ? m_runClient->outputImagesDir() : QString();
    const QUrl baseUrl = m_runClient ? m_runClient->baseUrl() : QUrl();

    QVector<ImageSource> sources;
    sources.reserve(images.size());
    for (const Inference::ComfyImage& image : images) {
        sources.push_back(outputDir.isEmpty() ? ImageSource::fromUrl(image.toUrl(baseUrl))
                                              : ImageSource::fromLocalFile(image.toFilePath(outputDir)));
    }

    // Remote outputs are shown as they are; only local files are composited.
    if (sources.size() == 1 || outputDir.isEmpty()) {
        m_gallery->setImages(sources);
        finishRun();
        return;
    }

    QStringList paths;
    for (const ImageSource& source : std::as_const(sources))
        paths.push_back(source.localPath());
    const QString gridPath = QDir(outputDir).filePath(u"grid-"_s + sources.last().fileName());

    m_run->setPhase(GenerationRun::Phase::Compositing);
    const QPointer<GenerationRun> run(m_run);

    Utils::Async::run(
        this,
        [paths, gridPath]() { return Inference::ImageGrid::composeFiles(paths, gridPath); },
        [this, run, sources, gridPath](Utils::Result result) {
            if (!runIsLive(run))
                return;
            if (!result) {
                m_gallery->setImages(sources);
                finishFailed(u"Could not write image grid: %1"_s.arg(result.message()));
                return;
            }

            QVector<ImageSource> gallery;
            gallery.reserve(sources.size() + 1);
            gallery.push_back(ImageSource::fromLocalFile(gridPath));
            gallery += sources;
            m_gallery->setImages(gallery);
            finishRun();
        },
        [this, run, sources](const QString& message) {
            if (!runIsLive(run))
                return;
            m_gallery->setImages(sources);
            finishFailed(message);
        });
}

void InferenceTextToImageViewModel::finishRun()
{
    if (!m_run)
        return;

    GenerationRun* run = std::exchange(m_run, nullptr);
    run->end();
    run->deleteLater();
    m_runClient.clear();

    setProgress(0, 0, {});
    setPreviewImage({});

    emit isGeneratingChanged(false);
    emit generationFinished();
}

void InferenceTextToImageViewModel::finishCancelled()
{
    if (!m_run)
        return;
    qCDebug(applog) << "Generation cancelled";
    finishRun();
}

void InferenceTextToImageViewModel::finishFailed(const QString& message)
{
    if (!m_run)
        return;
    qCWarning(applog) << "Generation failed:" << message;
    finishRun();
    emit generationFailed(message);
}

void InferenceTextToImageViewModel::setProgress(int value, int maximum, const QString& text)
{
    if (value == m_progressValue && maximum == m_progressMaximum && text == m_progressText)
        return;
    m_progressValue = value;
    m_progressMaximum = maximum;
    m_progressText = text;
    emit progressChanged();
}

void InferenceTextToImageViewModel::setPreviewImage(const QImage& image)
{
    if (image.isNull() && m_previewImage.isNull())
        return;
    m_previewImage = image;
    emit previewImageChanged();
}

bool InferenceTextToImageViewModel::runIsLive(const QPointer<GenerationRun>& run) const
{
    return run && run.data() == m_run && run->isActive();
}

} // namespace Kiln::ViewModels
