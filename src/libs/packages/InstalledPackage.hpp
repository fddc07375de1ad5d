// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/PackagesGlobal.hpp"

#include <QtCore/QDir>
#include <QtCore/QPointer>
#include <QtCore/QString>

namespace Packages {

class IExtensionManager;

// A generation package installed on disk.
struct PACKAGES_EXPORT InstalledPackage final {
    QString displayName;
    QString rootPath;
    QString extensionDirName = QStringLiteral("custom_nodes");

    bool isValid() const { return !rootPath.isEmpty(); }

    QString extensionsPath() const
    {
        return QDir(rootPath).filePath(extensionDirName);
    }
};

// The package type together with the installation it describes. The extension manager is
// owned elsewhere and may be absent for packages without extension support.
struct PACKAGES_EXPORT PackagePair final {
    QString packageName;
    QPointer<IExtensionManager> extensionManager;
    InstalledPackage installed;
};

} // namespace Packages
