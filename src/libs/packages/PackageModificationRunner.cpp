// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "packages/PackageModificationRunner.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QPointer>

#include <utility>

using namespace Qt::StringLiterals;

namespace Packages {

PackageModificationRunner::PackageModificationRunner(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<Packages::ProgressReport>();
    qRegisterMetaType<Utils::Result>();
}

PackageModificationRunner::~PackageModificationRunner()
{
    // Stops the step in flight without announcing a result.
    m_running = false;
    m_cancellation.cancel();
}

bool PackageModificationRunner::executeSteps(Steps steps)
{
    if (m_running || m_finished) {
        qCWarning(packageslog) << "Runner already used; ignoring" << steps.size() << "steps";
        return false;
    }

    m_steps = std::move(steps);
    m_running = true;
    emit isRunningChanged(true);

    QPointer<PackageModificationRunner> self(this);
    QMetaObject::invokeMethod(this, [self]() {
        if (self)
            self->runStep(0);
    }, Qt::QueuedConnection);
    return true;
}

void PackageModificationRunner::cancel()
{
    if (!m_running)
        return;
    qCInfo(packageslog) << "Cancelling package modification at step" << m_currentIndex;
    m_cancellation.cancel();
}

void PackageModificationRunner::runStep(int index)
{
    if (!m_running)
        return;

    if (m_cancellation.isCancellationRequested()) {
        finish(Utils::Result::failure(u"Cancelled."_s));
        return;
    }
    if (index >= int(m_steps.size())) {
        finish(Utils::Result::success());
        return;
    }

    m_currentIndex = index;
    IPackageStep* step = m_steps[std::size_t(index)].get();
    m_currentTitle = step->progressTitle();
    emit stepStarted(index, m_currentTitle);

    QPointer<PackageModificationRunner> self(this);
    auto completed = std::make_shared<bool>(false);

    step->execute(
        m_cancellation.token(),
        [self, completed](const ProgressReport& report) {
            if (!self || *completed)
                return;
            self->m_progress = report;
            if (!report.message.isEmpty())
                self->m_log.push_back(report.message);
            emit self->progressChanged(report);
        },
        [self, completed, index](const Utils::Result& result) {
            if (!self || *completed)
                return;
            *completed = true;

            if (!result.ok) {
                qCWarning(packageslog) << "Step" << index << "failed:" << result.message();
                self->finish(result);
                return;
            }

            QMetaObject::invokeMethod(self, [self, index]() {
                if (self)
                    self->runStep(index + 1);
            }, Qt::QueuedConnection);
        });
}

void PackageModificationRunner::finish(Utils::Result result)
{
    if (!m_running)
        return;

    m_result = std::move(result);
    m_running = false;
    m_finished = true;

    m_progress = ProgressReport{1.0, m_currentTitle, m_result.ok ? QString() : m_result.message()};
    emit progressChanged(m_progress);
    emit isRunningChanged(false);
    emit finished(m_result);
}

} // namespace Packages
