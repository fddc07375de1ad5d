// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/PromptTracker.hpp"

#include <iterator>
#include <utility>

using namespace Qt::StringLiterals;

namespace Inference {

ComfyTask* PromptTracker::createTask(const QString& promptId, QObject* parent)
{
    for (auto it = m_tasks.begin(); it != m_tasks.end();)
        it = it.value().isNull() ? m_tasks.erase(it) : std::next(it);

    auto* task = new ComfyTask(promptId, parent);
    m_tasks.insert(promptId, task);

    if (const auto it = m_earlyOutcomes.constFind(promptId); it != m_earlyOutcomes.cend()) {
        const Outcome outcome = it.value();
        m_earlyOutcomes.erase(it);
        m_earlyOrder.removeOne(promptId);
        qCDebug(inferencelog) << "Prompt" << promptId << "finished before it was acknowledged";
        if (outcome.failed)
            task->fail(outcome.message);
        else
            task->complete();
    }
    return task;
}

ComfyTask* PromptTracker::taskFor(const QString& promptId) const
{
    const QString id = promptId.isEmpty() ? m_currentPromptId : promptId;
    return m_tasks.value(id).data();
}

void PromptTracker::dispatch(const ComfyProtocol::SocketEvent& event)
{
    using Type = ComfyProtocol::SocketEvent::Type;
    switch (event.type) {
    case Type::Executing:
        if (!event.node) {
            const QString id = event.promptId.isEmpty() ? m_currentPromptId : event.promptId;
            m_currentPromptId.clear();
            finish(id, Outcome{});
            break;
        }
        if (!event.promptId.isEmpty())
            m_currentPromptId = event.promptId;
        if (ComfyTask* task = taskFor(event.promptId))
            task->setRunningNode(*event.node);
        break;
    case Type::Progress:
        if (ComfyTask* task = taskFor(event.promptId))
            task->reportProgress(event.value, event.maximum);
        break;
    case Type::ExecutionError:
        finish(event.promptId.isEmpty() ? m_currentPromptId : event.promptId, Outcome{true, event.errorMessage});
        break;
    case Type::ExecutionInterrupted:
        finish(event.promptId.isEmpty() ? m_currentPromptId : event.promptId, Outcome{true, u"Interrupted"_s});
        break;
    case Type::Status:
    case Type::ExecutionStart:
    case Type::ExecutionCached:
    case Type::Unknown:
        break;
    }
}

void PromptTracker::finish(const QString& promptId, const Outcome& outcome)
{
    if (promptId.isEmpty())
        return;

    if (const auto it = m_tasks.constFind(promptId); it != m_tasks.cend()) {
        // A task the client already disposed of needs nothing more.
        if (ComfyTask* task = it.value().data()) {
            if (outcome.failed)
                task->fail(outcome.message);
            else
                task->complete();
        }
        return;
    }

    if (!m_earlyOutcomes.contains(promptId)) {
        m_earlyOrder.push_back(promptId);
        while (m_earlyOrder.size() > kMaxEarlyOutcomes)
            m_earlyOutcomes.remove(m_earlyOrder.takeFirst());
    }
    m_earlyOutcomes.insert(promptId, outcome);
}

void PromptTracker::failAll(const QString& message)
{
    // Failing a task may destroy it or create new ones; work from a snapshot.
    const QHash<QString, QPointer<ComfyTask>> tasks = std::exchange(m_tasks, {});
    for (const QPointer<ComfyTask>& task : tasks) {
        if (task && !task->isFinished())
            task->fail(message);
    }
    m_earlyOutcomes.clear();
    m_earlyOrder.clear();
    m_currentPromptId.clear();
}

} // namespace Inference
