// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <memory>

class QSettings;

namespace Utils {

struct EnvironmentConfig final {
    QString organizationName;
    QString applicationName;

    // Replaces the platform config location; tests point this at a temporary directory.
    QString configRootOverride;

    qint64 maxStateDocumentBytes = 4 * 1024 * 1024;
};

struct DocumentLoadResult final {
    enum class Status : unsigned char {
        Ok,
        NotFound,
        Corrupt
    };

    Status status = Status::NotFound;
    QJsonObject object;
    bool fromBackup = false;
    QString error;

    bool isOk() const noexcept { return status == Status::Ok; }
};

// Per-application storage: an INI settings file plus named JSON state documents.
//
//   <root>/<applicationName>/settings.ini
//   <root>/<applicationName>/state/<name>.json      (and <name>.json.bak, the previous save)
//
// Loading a state document falls back to the backup when the primary copy is unreadable.
class UTILS_EXPORT Environment final
{
public:
    explicit Environment(EnvironmentConfig config);

    const EnvironmentConfig& config() const noexcept { return m_config; }

    QString configDir() const { return m_configDir; }
    QString settingsFilePath() const;
    QString stateFilePath(QStringView name, bool backup = false) const;

    QVariant value(QStringView key, const QVariant& def = {}) const;
    QString stringValue(QStringView key, const QString& def = {}) const;
    QStringList stringListValue(QStringView key, const QStringList& def = {}) const;
    bool contains(QStringView key) const;

    void setValue(QStringView key, const QVariant& value);
    void remove(QStringView key);

    DocumentLoadResult loadState(QStringView name) const;
    Result saveState(QStringView name, const QJsonObject& object) const;

    // Letters, digits, '-', '_' and '.'; never a path.
    static bool isValidStateName(QStringView name);

private:
    std::unique_ptr<QSettings> openSettings() const;
    static void sync(QSettings& settings);
    DocumentLoadResult readDocument(const QString& path, bool fromBackup) const;

    EnvironmentConfig m_config;
    QString m_configDir;
};

} // namespace Utils
