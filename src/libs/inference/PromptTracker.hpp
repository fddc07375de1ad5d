// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/ComfyProtocol.hpp"
#include "inference/ComfyTask.hpp"
#include "inference/InferenceGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Inference {

// Routes WebSocket events to the ComfyTask of their prompt. The socket and the /prompt reply
// race: a cached prompt can finish before its id is known here, so terminal events for unknown
// ids are held and replayed when the task is created.
class INFERENCE_EXPORT PromptTracker final
{
public:
    static constexpr int kMaxEarlyOutcomes = 32;

    // Creates the task for an accepted prompt, already finished if its outcome arrived first.
    ComfyTask* createTask(const QString& promptId, QObject* parent);

    void dispatch(const ComfyProtocol::SocketEvent& event);

    // Fails every unfinished task, e.g. when the connection goes away.
    void failAll(const QString& message);

    ComfyTask* taskFor(const QString& promptId) const;
    int earlyOutcomeCount() const { return int(m_earlyOutcomes.size()); }

private:
    struct Outcome {
        bool failed = false;
        QString message;
    };

    void finish(const QString& promptId, const Outcome& outcome);

    QHash<QString, QPointer<ComfyTask>> m_tasks;
    QHash<QString, Outcome> m_earlyOutcomes;
    QStringList m_earlyOrder;
    QString m_currentPromptId;
};

} // namespace Inference
