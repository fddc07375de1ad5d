// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/Environment.hpp"

#include "utils/Macros.hpp"
#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>

#include <utility>

using namespace Qt::StringLiterals;

namespace Utils {

Environment::Environment(EnvironmentConfig config)
    : m_config(std::move(config))
{
    const QString root = m_config.configRootOverride.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        : m_config.configRootOverride;
    const QString appName = m_config.applicationName.isEmpty() ? u"Kiln"_s : m_config.applicationName;
    m_configDir = QDir(QDir(root).filePath(appName)).absolutePath();
}

QString Environment::settingsFilePath() const
{
    return QDir(m_configDir).filePath(u"settings.ini"_s);
}

QString Environment::stateFilePath(QStringView name, bool backup) const
{
    const QString file = name.toString() + (backup ? ".json.bak"_L1 : ".json"_L1);
    return QDir(m_configDir).filePath(u"state/"_s + file);
}

std::unique_ptr<QSettings> Environment::openSettings() const
{
    auto settings = std::make_unique<QSettings>(settingsFilePath(), QSettings::IniFormat);
    settings->setFallbacksEnabled(false);
    return settings;
}

void Environment::sync(QSettings& settings)
{
    settings.sync();
    if (settings.status() != QSettings::NoError)
        qCWarning(utilslog) << "Failed to write settings file" << settings.fileName();
}

QVariant Environment::value(QStringView key, const QVariant& def) const
{
    return openSettings()->value(key.toString(), def);
}

QString Environment::stringValue(QStringView key, const QString& def) const
{
    return value(key, def).toString();
}

QStringList Environment::stringListValue(QStringView key, const QStringList& def) const
{
    return value(key, def).toStringList();
}

bool Environment::contains(QStringView key) const
{
    return openSettings()->contains(key.toString());
}

void Environment::setValue(QStringView key, const QVariant& value)
{
    const auto settings = openSettings();
    settings->setValue(key.toString(), value);
    sync(*settings);
}

void Environment::remove(QStringView key)
{
    const auto settings = openSettings();
    settings->remove(key.toString());
    sync(*settings);
}

bool Environment::isValidStateName(QStringView name)
{
    if (name.isEmpty() || name.startsWith(u'.'))
        return false;
    for (const QChar c : name) {
        if (!c.isLetterOrNumber() && c != u'-' && c != u'_' && c != u'.')
            return false;
    }
    return true;
}

DocumentLoadResult Environment::readDocument(const QString& path, bool fromBackup) const
{
    DocumentLoadResult result;
    result.fromBackup = fromBackup;

    const QFileInfo info(path);
    if (!info.exists())
        return result;

    QString error;
    result.object = JsonFileUtils::readObject(path, &error, m_config.maxStateDocumentBytes);
    result.error = error;
    result.status = error.isEmpty() ? DocumentLoadResult::Status::Ok : DocumentLoadResult::Status::Corrupt;
    return result;
}

DocumentLoadResult Environment::loadState(QStringView name) const
{
    if (!isValidStateName(name)) {
        DocumentLoadResult invalid;
        invalid.status = DocumentLoadResult::Status::Corrupt;
        invalid.error = u"Invalid state document name: %1"_s.arg(name);
        return invalid;
    }

    const DocumentLoadResult primary = readDocument(stateFilePath(name), false);
    if (primary.isOk())
        return primary;

    const DocumentLoadResult backup = readDocument(stateFilePath(name, true), true);
    if (backup.isOk()) {
        if (primary.status == DocumentLoadResult::Status::Corrupt)
            qCWarning(utilslog) << "Recovered state" << name << "from backup:" << primary.error;
        return backup;
    }

    // Report the primary's problem first; a missing primary with a broken backup is still corrupt.
    if (primary.status == DocumentLoadResult::Status::Corrupt)
        return primary;
    return backup;
}

Result Environment::saveState(QStringView name, const QJsonObject& object) const
{
    UTILS_GUARD_OK(isValidStateName(name), u"Invalid state document name: %1"_s.arg(name));

    const QByteArray bytes = QJsonDocument(object).toJson(QJsonDocument::Compact);
    UTILS_GUARD_OK(bytes.size() <= m_config.maxStateDocumentBytes,
                   u"State document %1 exceeds %2 bytes."_s.arg(name).arg(m_config.maxStateDocumentBytes));

    const QString primary = stateFilePath(name);
    const QString backup = stateFilePath(name, true);
    if (QFile::exists(primary)) {
        QFile::remove(backup);
        if (!QFile::copy(primary, backup))
            qCWarning(utilslog) << "Failed to keep previous state as" << backup;
    }

    return JsonFileUtils::writeObjectAtomic(primary, object, QJsonDocument::Compact);
}

} // namespace Utils
