// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/PackageExtension.hpp"
#include "packages/PackagesGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QVector>

namespace Packages {

struct PACKAGES_EXPORT SynchronizedExtensions final {
    QVector<PackageExtension> available;
    QVector<InstalledPackageExtension> installed;
};

// Matches installed extensions to manifest entries by repository reference.
class PACKAGES_EXPORT ExtensionSynchronizer final
{
public:
    // Removes one trailing ".git".
    static QString stripGitSuffix(const QString& reference);

    // `available` is returned as given. Every installed entry with a repository URL that matches
    // a file reference of an available entry gets that entry as its definition; all others pass
    // through unchanged. Identities are never altered.
    static SynchronizedExtensions synchronize(const QVector<PackageExtension>& available,
                                              const QVector<InstalledPackageExtension>& installed);
};

} // namespace Packages
