// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <inference/ComfyTask.hpp>
#include <utils/Subscription.hpp>
#include <utils/async/Cancellation.hpp>

#include <QtCore/QObject>
#include <QtCore/QPointer>

#include <vector>

namespace Kiln::ViewModels {

// One text-to-image generation from submit to result. Owns every handler attached for the run;
// end() detaches all of them and releases the task, after which late callbacks are ignored.
class APP_EXPORT GenerationRun final : public QObject
{
    Q_OBJECT

public:
    enum class Phase : unsigned char {
        Queueing,
        Running,
        FetchingOutputs,
        Compositing,
        Ended
    };

    explicit GenerationRun(QObject* parent = nullptr);
    ~GenerationRun() override;

    Utils::Async::CancellationToken token() const { return m_cancellation.token(); }
    bool isCancellationRequested() const noexcept { return m_cancellation.isCancellationRequested(); }
    void cancel() { m_cancellation.cancel(); }

    Phase phase() const noexcept { return m_phase; }
    void setPhase(Phase phase) { if (m_phase != Phase::Ended) m_phase = phase; }
    bool isActive() const noexcept { return m_phase != Phase::Ended; }

    Inference::ComfyTask* task() const { return m_task.data(); }
    void setTask(Inference::ComfyTask* task) { m_task = task; }

    void setPreviewSubscription(Utils::Subscription subscription) { m_preview = std::move(subscription); }
    void setCancelRegistration(Utils::Subscription subscription) { m_cancelRegistration = std::move(subscription); }
    void setClientSubscription(Utils::Subscription subscription) { m_client = std::move(subscription); }
    void addTaskSubscription(Utils::Subscription subscription) { m_taskSubscriptions.push_back(std::move(subscription)); }

    void end();

private:
    Utils::Async::CancellationSource m_cancellation;
    QPointer<Inference::ComfyTask> m_task;
    Utils::Subscription m_preview;
    Utils::Subscription m_cancelRegistration;
    Utils::Subscription m_client;
    std::vector<Utils::Subscription> m_taskSubscriptions;
    Phase m_phase = Phase::Queueing;
};

} // namespace Kiln::ViewModels
