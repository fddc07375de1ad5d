// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/ComfyImage.hpp"
#include "inference/InferenceGlobal.hpp"
#include "inference/NodeGraph.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>
#include <QtCore/QVector>

#include <optional>

// Wire format of a ComfyUI-compatible backend: request bodies, replies and WebSocket frames.
namespace Inference::ComfyProtocol {

using OutputImages = QHash<QString, QVector<ComfyImage>>;

struct INFERENCE_EXPORT SocketEvent final {
    enum class Type : unsigned char {
        Unknown,
        Status,
        ExecutionStart,
        ExecutionCached,
        Executing,
        Progress,
        ExecutionError,
        ExecutionInterrupted
    };

    Type type = Type::Unknown;
    QString promptId;

    // Progress
    int value = 0;
    int maximum = 0;

    // Executing: an unset node means the prompt has finished.
    std::optional<QString> node;

    // ExecutionError
    QString errorMessage;
};

enum class PreviewFormat : unsigned char {
    Unknown = 0,
    Jpeg = 1,
    Png = 2
};

struct INFERENCE_EXPORT PreviewFrame final {
    PreviewFormat format = PreviewFormat::Unknown;
    QByteArray imageBytes;

    const char* formatName() const;
};

INFERENCE_EXPORT QUrl endpoint(const QUrl& baseUrl, const QString& relativePath);
INFERENCE_EXPORT QUrl webSocketUrl(const QUrl& baseUrl, const QString& clientId);

INFERENCE_EXPORT QByteArray promptRequestBody(const NodeGraph& graph, const QString& clientId);
INFERENCE_EXPORT QString parsePromptId(const QByteArray& reply, QString* error = nullptr);

// Outputs of `promptId` keyed by node name. Nodes without images are omitted.
INFERENCE_EXPORT OutputImages parseHistory(const QByteArray& reply,
                                           const QString& promptId,
                                           QString* error = nullptr);

// Options of a combo input in an /object_info reply, e.g. ("KSampler", "sampler_name").
INFERENCE_EXPORT QStringList parseObjectInfoChoices(const QJsonObject& objectInfo,
                                                    const QString& classType,
                                                    const QString& inputName);

INFERENCE_EXPORT SocketEvent parseTextFrame(const QByteArray& frame, QString* error = nullptr);

// Binary frames carry a big-endian event type (1 = preview) and image format, then the image.
// Frames of other event types yield nullopt without an error.
INFERENCE_EXPORT std::optional<PreviewFrame> parseBinaryFrame(const QByteArray& frame, QString* error = nullptr);

} // namespace Inference::ComfyProtocol
