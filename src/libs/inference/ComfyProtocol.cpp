// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/ComfyProtocol.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QtEndian>
#include <QtCore/QUrlQuery>

using namespace Qt::StringLiterals;

namespace Inference::ComfyProtocol {

namespace {

constexpr quint32 kPreviewImageEvent = 1;
constexpr int kBinaryHeaderBytes = 8;

void setError(QString* error, const QString& message)
{
    if (error)
        *error = message;
}

SocketEvent::Type eventType(const QString& name)
{
    static const QHash<QString, SocketEvent::Type> kTypes{
        {u"status"_s, SocketEvent::Type::Status},
        {u"execution_start"_s, SocketEvent::Type::ExecutionStart},
        {u"execution_cached"_s, SocketEvent::Type::ExecutionCached},
        {u"executing"_s, SocketEvent::Type::Executing},
        {u"progress"_s, SocketEvent::Type::Progress},
        {u"execution_error"_s, SocketEvent::Type::ExecutionError},
        {u"execution_interrupted"_s, SocketEvent::Type::ExecutionInterrupted},
    };
    return kTypes.value(name, SocketEvent::Type::Unknown);
}

} // namespace

const char* PreviewFrame::formatName() const
{
    switch (format) {
    case PreviewFormat::Jpeg: return "JPEG";
    case PreviewFormat::Png:  return "PNG";
    case PreviewFormat::Unknown: break;
    }
    return nullptr;
}

QUrl endpoint(const QUrl& baseUrl, const QString& relativePath)
{
    QUrl url = baseUrl;
    QString path = url.path();
    if (!path.endsWith(QLatin1Char('/')))
        path += QLatin1Char('/');
    url.setPath(path + relativePath);
    url.setQuery(QString());
    return url;
}

QUrl webSocketUrl(const QUrl& baseUrl, const QString& clientId)
{
    QUrl url = endpoint(baseUrl, u"ws"_s);
    url.setScheme(baseUrl.scheme() == "https"_L1 ? u"wss"_s : u"ws"_s);

    QUrlQuery query;
    query.addQueryItem(u"clientId"_s, clientId);
    url.setQuery(query);
    return url;
}

QByteArray promptRequestBody(const NodeGraph& graph, const QString& clientId)
{
    const QJsonObject body{
        {u"prompt"_s, graph.toJson()},
        {u"client_id"_s, clientId},
    };
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QString parsePromptId(const QByteArray& reply, QString* error)
{
    QString parseError;
    const QJsonObject root = Utils::JsonFileUtils::parseObject(reply, u"/prompt reply"_s, &parseError);
    if (!parseError.isEmpty()) {
        setError(error, parseError);
        return {};
    }

    const QString id = root.value("prompt_id"_L1).toString();
    if (id.isEmpty()) {
        setError(error, u"The /prompt reply carries no prompt_id."_s);
        return {};
    }

    if (error)
        error->clear();
    return id;
}

OutputImages parseHistory(const QByteArray& reply, const QString& promptId, QString* error)
{
    QString parseError;
    const QJsonObject root = Utils::JsonFileUtils::parseObject(reply, u"/history reply"_s, &parseError);
    if (!parseError.isEmpty()) {
        setError(error, parseError);
        return {};
    }

    const QJsonValue entry = root.value(promptId);
    if (!entry.isObject()) {
        setError(error, u"History has no entry for prompt %1."_s.arg(promptId));
        return {};
    }

    OutputImages out;
    const QJsonObject outputs = entry.toObject().value("outputs"_L1).toObject();
    for (auto it = outputs.begin(); it != outputs.end(); ++it) {
        const QJsonArray images = it.value().toObject().value("images"_L1).toArray();
        if (images.isEmpty())
            continue;

        QVector<ComfyImage> list;
        list.reserve(images.size());
        for (const QJsonValue& v : images) {
            const QJsonObject o = v.toObject();
            ComfyImage image;
            image.filename = o.value("filename"_L1).toString();
            image.subfolder = o.value("subfolder"_L1).toString();
            image.type = o.value("type"_L1).toString();
            if (!image.filename.isEmpty())
                list.push_back(std::move(image));
        }
        out.insert(it.key(), std::move(list));
    }

    if (error)
        error->clear();
    return out;
}

QStringList parseObjectInfoChoices(const QJsonObject& objectInfo, const QString& classType, const QString& inputName)
{
    const QJsonObject inputs = objectInfo.value(classType).toObject().value("input"_L1).toObject();

    for (const auto group : {"required"_L1, "optional"_L1}) {
        const QJsonValue spec = inputs.value(group).toObject().value(inputName);
        if (!spec.isArray())
            continue;

        // [[choice, ...], {options}]
        const QJsonArray choices = spec.toArray().at(0).toArray();
        QStringList out;
        out.reserve(choices.size());
        for (const QJsonValue& c : choices) {
            if (c.isString())
                out.push_back(c.toString());
        }
        return out;
    }
    return {};
}

SocketEvent parseTextFrame(const QByteArray& frame, QString* error)
{
    SocketEvent event;

    QString parseError;
    const QJsonObject root = Utils::JsonFileUtils::parseObject(frame, u"WebSocket frame"_s, &parseError);
    if (!parseError.isEmpty()) {
        setError(error, parseError);
        return event;
    }

    const QJsonObject data = root.value("data"_L1).toObject();
    event.type = eventType(root.value("type"_L1).toString());
    event.promptId = data.value("prompt_id"_L1).toString();

    switch (event.type) {
    case SocketEvent::Type::Progress:
        event.value = data.value("value"_L1).toInt();
        event.maximum = data.value("max"_L1).toInt();
        break;
    case SocketEvent::Type::Executing: {
        const QJsonValue node = data.value("node"_L1);
        if (node.isString())
            event.node = node.toString();
        break;
    }
    case SocketEvent::Type::ExecutionError: {
        const QString type = data.value("exception_type"_L1).toString();
        const QString message = data.value("exception_message"_L1).toString().trimmed();
        const QString node = data.value("node_type"_L1).toString();
        event.errorMessage = node.isEmpty() ? message : u"%1: %2"_s.arg(node, message);
        if (!type.isEmpty())
            event.errorMessage += u" (%1)"_s.arg(type);
        break;
    }
    default:
        break;
    }

    if (error)
        error->clear();
    return event;
}

std::optional<PreviewFrame> parseBinaryFrame(const QByteArray& frame, QString* error)
{
    if (frame.size() < kBinaryHeaderBytes) {
        setError(error, u"Binary frame is shorter than its header (%1 bytes)."_s.arg(frame.size()));
        return std::nullopt;
    }

    const auto* bytes = reinterpret_cast<const uchar*>(frame.constData());
    const quint32 event = qFromBigEndian<quint32>(bytes);
    const quint32 format = qFromBigEndian<quint32>(bytes + 4);

    if (error)
        error->clear();
    if (event != kPreviewImageEvent)
        return std::nullopt;

    PreviewFrame preview;
    if (format == 1)
        preview.format = PreviewFormat::Jpeg;
    else if (format == 2)
        preview.format = PreviewFormat::Png;
    else {
        setError(error, u"Unknown preview image format %1."_s.arg(format));
        return std::nullopt;
    }

    preview.imageBytes = frame.mid(kBinaryHeaderBytes);
    return preview;
}

} // namespace Inference::ComfyProtocol
