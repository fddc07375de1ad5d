// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

using namespace Qt::StringLiterals;

namespace Utils::JsonFileUtils {

namespace {

QJsonObject fail(QString* error, const QString& message)
{
    if (error)
        *error = message;
    return {};
}

} // namespace

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QFileInfo target(path.trimmed());
    if (target.filePath().isEmpty())
        return Result::failure(u"No file name given for the JSON document."_s);

    if (!QDir().mkpath(target.absolutePath()))
        return Result::failure(u"Cannot create directory %1"_s.arg(target.absolutePath()));

    QSaveFile file(target.filePath());
    if (!file.open(QIODevice::WriteOnly))
        return Result::failure(u"Cannot write %1: %2"_s.arg(file.fileName(), file.errorString()));

    const QByteArray bytes = QJsonDocument(object).toJson(format);
    if (file.write(bytes) != bytes.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return Result::failure(u"Cannot write %1: %2"_s.arg(file.fileName(), reason));
    }
    if (!file.commit())
        return Result::failure(u"Cannot replace %1: %2"_s.arg(file.fileName(), file.errorString()));
    return Result::success();
}

QJsonObject readObject(const QString& path, QString* error, qint64 maxBytes)
{
    QFile file(path.trimmed());
    if (file.fileName().isEmpty())
        return fail(error, u"No file name given for the JSON document."_s);
    if (!file.open(QIODevice::ReadOnly))
        return fail(error, u"Cannot read %1: %2"_s.arg(file.fileName(), file.errorString()));
    if (maxBytes >= 0 && file.size() > maxBytes)
        return fail(error, u"%1 is larger than %2 bytes."_s.arg(file.fileName()).arg(maxBytes));

    return parseObject(file.readAll(), file.fileName(), error);
}

QJsonObject parseObject(const QByteArray& bytes, const QString& source, QString* error)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(error, u"Malformed JSON in %1 at offset %2: %3"_s
                               .arg(source).arg(parseError.offset).arg(parseError.errorString()));
    }
    if (!doc.isObject())
        return fail(error, u"Expected a JSON object in %1 but found another value."_s.arg(source));

    if (error)
        error->clear();
    return doc.object();
}

} // namespace Utils::JsonFileUtils
