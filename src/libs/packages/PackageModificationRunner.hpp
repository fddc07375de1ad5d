// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/PackageStep.hpp"
#include "packages/PackagesGlobal.hpp"

#include <utils/Result.hpp>
#include <utils/async/Cancellation.hpp>

#include <QtCore/QObject>
#include <QtCore/QStringList>

#include <memory>
#include <vector>

namespace Packages {

// Executes package steps one after another. The first failing step ends the run; later steps
// are skipped. Each step is started from the event loop, so a step that completes inside
// execute() never nests the next one.
class PACKAGES_EXPORT PackageModificationRunner final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool isRunning READ isRunning NOTIFY isRunningChanged)
    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)
    Q_PROPERTY(QString currentStepTitle READ currentStepTitle NOTIFY stepStarted)

public:
    using Steps = std::vector<std::unique_ptr<IPackageStep>>;

    explicit PackageModificationRunner(QObject* parent = nullptr);
    ~PackageModificationRunner() override;

    bool isRunning() const noexcept { return m_running; }
    bool isFinished() const noexcept { return m_finished; }
    bool failed() const noexcept { return m_finished && !m_result.ok; }
    const Utils::Result& result() const noexcept { return m_result; }

    double progress() const noexcept { return m_progress.progress; }
    const ProgressReport& lastReport() const noexcept { return m_progress; }
    QString currentStepTitle() const { return m_currentTitle; }
    int stepCount() const noexcept { return int(m_steps.size()); }

    // Progress messages of every step, in order.
    const QStringList& log() const noexcept { return m_log; }

    // Whether a host should open its progress dialog as soon as the run is announced.
    bool showDialogOnStart() const noexcept { return m_showDialogOnStart; }
    void setShowDialogOnStart(bool value) { m_showDialogOnStart = value; }

    // A runner executes once.
    bool executeSteps(Steps steps);

public slots:
    void cancel();

signals:
    void isRunningChanged(bool running);
    void progressChanged(const Packages::ProgressReport& report);
    void stepStarted(int index, const QString& title);
    void finished(const Utils::Result& result);

private:
    void runStep(int index);
    void finish(Utils::Result result);

    Steps m_steps;
    Utils::Async::CancellationSource m_cancellation;
    Utils::Result m_result;
    ProgressReport m_progress;
    QString m_currentTitle;
    QStringList m_log;
    int m_currentIndex = -1;
    bool m_running = false;
    bool m_finished = false;
    bool m_showDialogOnStart = false;
};

} // namespace Packages
