// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

// JSON object documents on disk and on the wire. Errors come back through `error`, which is
// cleared on success; a null `error` just drops the message.
namespace Utils::JsonFileUtils {

// Replaces `path` in one step (QSaveFile), creating parent directories as needed.
UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// A negative `maxBytes` reads files of any size.
UTILS_EXPORT QJsonObject readObject(const QString& path, QString* error = nullptr, qint64 maxBytes = -1);

// `source` names where the bytes came from (file or URL) in the error message.
UTILS_EXPORT QJsonObject parseObject(const QByteArray& bytes, const QString& source, QString* error = nullptr);

} // namespace Utils::JsonFileUtils
