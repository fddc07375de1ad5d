// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/IExtensionManager.hpp"
#include "packages/InstalledPackage.hpp"
#include "packages/PackageExtension.hpp"
#include "packages/PackageStep.hpp"
#include "packages/PackagesGlobal.hpp"

#include <QtCore/QPointer>

namespace Packages {

class PACKAGES_EXPORT InstallExtensionStep final : public IPackageStep
{
public:
    InstallExtensionStep(QPointer<IExtensionManager> manager, InstalledPackage package, PackageExtension extension);

    QString progressTitle() const override;

    void execute(const Utils::Async::CancellationToken& token, ProgressCallback progress, DoneCallback done) override;

    const PackageExtension& extension() const noexcept { return m_extension; }

private:
    QPointer<IExtensionManager> m_manager;
    InstalledPackage m_package;
    PackageExtension m_extension;
};

class PACKAGES_EXPORT UninstallExtensionStep final : public IPackageStep
{
public:
    UninstallExtensionStep(QPointer<IExtensionManager> manager,
                           InstalledPackage package,
                           InstalledPackageExtension extension);

    QString progressTitle() const override;

    void execute(const Utils::Async::CancellationToken& token, ProgressCallback progress, DoneCallback done) override;

    const InstalledPackageExtension& extension() const noexcept { return m_extension; }

private:
    QPointer<IExtensionManager> m_manager;
    InstalledPackage m_package;
    InstalledPackageExtension m_extension;
};

} // namespace Packages
