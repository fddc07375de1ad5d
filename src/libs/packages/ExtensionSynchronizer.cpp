// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "packages/ExtensionSynchronizer.hpp"

#include <QtCore/QHash>

using namespace Qt::StringLiterals;

namespace Packages {

QString ExtensionSynchronizer::stripGitSuffix(const QString& reference)
{
    if (!reference.endsWith(".git"_L1))
        return reference;
    return reference.chopped(4);
}

SynchronizedExtensions ExtensionSynchronizer::synchronize(const QVector<PackageExtension>& available,
                                                          const QVector<InstalledPackageExtension>& installed)
{
    // Several entries may declare the same reference. The smallest identity wins so the outcome
    // does not depend on manifest order.
    QHash<QString, const PackageExtension*> byReference;
    for (const PackageExtension& ext : available) {
        const QString id = ext.identity();
        for (const QString& file : ext.files) {
            const QString key = stripGitSuffix(file);
            if (key.isEmpty())
                continue;
            auto it = byReference.find(key);
            if (it == byReference.end())
                byReference.insert(key, &ext);
            else if (id < it.value()->identity())
                it.value() = &ext;
        }
    }

    SynchronizedExtensions out;
    out.available = available;
    out.installed.reserve(installed.size());

    for (const InstalledPackageExtension& ext : installed) {
        if (!ext.gitRepositoryUrl || ext.gitRepositoryUrl->isEmpty()) {
            out.installed.push_back(ext);
            continue;
        }

        const PackageExtension* match = byReference.value(stripGitSuffix(*ext.gitRepositoryUrl), nullptr);
        out.installed.push_back(match ? ext.withDefinition(*match) : ext);
    }

    return out;
}

} // namespace Packages
