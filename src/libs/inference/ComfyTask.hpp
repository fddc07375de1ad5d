// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QString>

namespace Inference {

struct INFERENCE_EXPORT ProgressUpdate final {
    int value = 0;
    int maximum = 0;
    QString runningNode;    // empty when the backend has not named one yet
    QString promptId;

    // "(3 / 20) Sampler"
    QString text() const;
};

// Handle for one queued prompt. The client drives it from WebSocket events; the submitting flow
// owns it from queuePrompt() on and disposes of it with deleteLater().
class INFERENCE_EXPORT ComfyTask final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString id READ id CONSTANT)
    Q_PROPERTY(QString runningNode READ runningNode NOTIFY runningNodeChanged)
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    enum class State : unsigned char {
        Pending,
        Completed,
        Failed
    };
    Q_ENUM(State)

    explicit ComfyTask(QString id, QObject* parent = nullptr);

    QString id() const { return m_id; }
    QString runningNode() const { return m_runningNode; }
    State state() const noexcept { return m_state; }
    bool isFinished() const noexcept { return m_state != State::Pending; }
    QString errorMessage() const { return m_error; }

    void setRunningNode(const QString& node);
    void reportProgress(int value, int maximum);

    // First completion wins; later calls are ignored.
    void complete();
    void fail(const QString& message);

signals:
    void progressUpdated(const Inference::ProgressUpdate& update);
    void runningNodeChanged(const QString& node);
    void stateChanged(Inference::ComfyTask::State state);
    void completed();
    void failed(const QString& message);

private:
    QString m_id;
    QString m_runningNode;
    QString m_error;
    State m_state = State::Pending;
};

} // namespace Inference

Q_DECLARE_METATYPE(Inference::ProgressUpdate)
