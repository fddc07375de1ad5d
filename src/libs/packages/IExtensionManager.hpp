// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/InstalledPackage.hpp"
#include "packages/PackageExtension.hpp"
#include "packages/PackageStep.hpp"
#include "packages/PackagesGlobal.hpp"

#include <utils/Result.hpp>
#include <utils/async/Cancellation.hpp>

#include <QtCore/QObject>
#include <QtCore/QUrl>
#include <QtCore/QVector>

#include <functional>

namespace Packages {

// Lists, installs and removes extensions of one package type. Every operation reports through
// its callback on the manager's thread, exactly once.
class PACKAGES_EXPORT IExtensionManager : public QObject
{
    Q_OBJECT

public:
    using ManifestCallback = std::function<void(const QVector<PackageExtension>&, const Utils::Result&)>;
    using InstalledCallback = std::function<void(const QVector<InstalledPackageExtension>&, const Utils::Result&)>;

    using QObject::QObject;
    ~IExtensionManager() override = default;

    virtual QVector<QUrl> manifests(const InstalledPackage& package) const = 0;

    virtual void fetchManifestExtensions(const QVector<QUrl>& manifests, ManifestCallback done) = 0;
    virtual void fetchInstalledExtensions(const InstalledPackage& package, InstalledCallback done) = 0;

    virtual void installExtension(const InstalledPackage& package,
                                  const PackageExtension& extension,
                                  const Utils::Async::CancellationToken& token,
                                  ProgressCallback progress,
                                  DoneCallback done) = 0;

    virtual void uninstallExtension(const InstalledPackage& package,
                                    const InstalledPackageExtension& extension,
                                    const Utils::Async::CancellationToken& token,
                                    ProgressCallback progress,
                                    DoneCallback done) = 0;
};

} // namespace Packages
