// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/ComfyTask.hpp"

#include <utility>

namespace Inference {

QString ProgressUpdate::text() const
{
    QString out = QStringLiteral("(%1 / %2)").arg(value).arg(maximum);
    if (!runningNode.isEmpty())
        out += QLatin1Char(' ') + runningNode;
    return out;
}

ComfyTask::ComfyTask(QString id, QObject* parent)
    : QObject(parent)
    , m_id(std::move(id))
{}

void ComfyTask::setRunningNode(const QString& node)
{
    if (m_runningNode == node)
        return;
    m_runningNode = node;
    emit runningNodeChanged(m_runningNode);
}

void ComfyTask::reportProgress(int value, int maximum)
{
    if (isFinished())
        return;

    ProgressUpdate update;
    update.value = value;
    update.maximum = maximum;
    update.runningNode = m_runningNode;
    update.promptId = m_id;
    emit progressUpdated(update);
}

void ComfyTask::complete()
{
    if (isFinished())
        return;
    m_state = State::Completed;
    emit stateChanged(m_state);
    emit completed();
}

void ComfyTask::fail(const QString& message)
{
    if (isFinished())
        return;
    m_state = State::Failed;
    m_error = message;
    qCDebug(inferencelog) << "Prompt" << m_id << "failed:" << message;
    emit stateChanged(m_state);
    emit failed(message);
}

} // namespace Inference
