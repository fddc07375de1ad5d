// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <utility>

namespace Inference {

struct INFERENCE_EXPORT ApiError final {
    enum class Kind : unsigned char {
        None,
        Rejected,           // backend answered with an error status
        Network,
        Timeout,
        Cancelled,
        InvalidResponse
    };

    Kind kind = Kind::None;
    int httpStatus = 0;
    QString message;
    QByteArray body;

    bool isError() const noexcept { return kind != Kind::None; }
    bool isCancelled() const noexcept { return kind == Kind::Cancelled; }

    static ApiError none() { return {}; }

    static ApiError make(Kind kind, QString message, int httpStatus = 0, QByteArray body = {})
    {
        ApiError e;
        e.kind = kind;
        e.httpStatus = httpStatus;
        e.message = std::move(message);
        e.body = std::move(body);
        return e;
    }

    // "Rejected (400): message"
    QString summary() const
    {
        QString text = kindName(kind);
        if (httpStatus > 0)
            text += QStringLiteral(" (%1)").arg(httpStatus);
        if (!message.isEmpty())
            text += QStringLiteral(": ") + message;
        return text;
    }

    static QString kindName(Kind kind)
    {
        switch (kind) {
        case Kind::None:            return QStringLiteral("No error");
        case Kind::Rejected:        return QStringLiteral("Rejected");
        case Kind::Network:         return QStringLiteral("Network error");
        case Kind::Timeout:         return QStringLiteral("Timed out");
        case Kind::Cancelled:       return QStringLiteral("Cancelled");
        case Kind::InvalidResponse: return QStringLiteral("Invalid response");
        }
        return {};
    }
};

} // namespace Inference

Q_DECLARE_METATYPE(Inference::ApiError)
