// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <packages/InstalledPackage.hpp>
#include <utils/Environment.hpp>

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Kiln::Settings {

struct APP_EXPORT PackageSettings final {
    QString packageName = QStringLiteral("ComfyUI");
    QString rootPath;
    QString extensionDirName = QStringLiteral("custom_nodes");
    QStringList manifestLocations = defaultManifestLocations();

    bool operator==(const PackageSettings&) const = default;

    bool hasPackage() const { return !rootPath.trimmed().isEmpty(); }
    Packages::InstalledPackage installedPackage() const;

    static QStringList defaultManifestLocations();

    static PackageSettings load(const Utils::Environment& env);
    void save(Utils::Environment& env) const;
};

} // namespace Kiln::Settings
