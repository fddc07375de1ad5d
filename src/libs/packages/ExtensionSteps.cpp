// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "packages/ExtensionSteps.hpp"

#include <utility>

using namespace Qt::StringLiterals;

namespace Packages {

InstallExtensionStep::InstallExtensionStep(QPointer<IExtensionManager> manager,
                                           InstalledPackage package,
                                           PackageExtension extension)
    : m_manager(std::move(manager))
    , m_package(std::move(package))
    , m_extension(std::move(extension))
{}

QString InstallExtensionStep::progressTitle() const
{
    return u"Installing %1"_s.arg(m_extension.title);
}

void InstallExtensionStep::execute(const Utils::Async::CancellationToken& token,
                                   ProgressCallback progress,
                                   DoneCallback done)
{
    if (!m_manager) {
        done(Utils::Result::failure(u"No extension manager is available to install %1."_s.arg(m_extension.title)));
        return;
    }
    m_manager->installExtension(m_package, m_extension, token, std::move(progress), std::move(done));
}

UninstallExtensionStep::UninstallExtensionStep(QPointer<IExtensionManager> manager,
                                               InstalledPackage package,
                                               InstalledPackageExtension extension)
    : m_manager(std::move(manager))
    , m_package(std::move(package))
    , m_extension(std::move(extension))
{}

QString UninstallExtensionStep::progressTitle() const
{
    return u"Uninstalling %1"_s.arg(m_extension.title());
}

void UninstallExtensionStep::execute(const Utils::Async::CancellationToken& token,
                                     ProgressCallback progress,
                                     DoneCallback done)
{
    if (!m_manager) {
        done(Utils::Result::failure(u"No extension manager is available to remove %1."_s.arg(m_extension.title())));
        return;
    }
    m_manager->uninstallExtension(m_package, m_extension, token, std::move(progress), std::move(done));
}

} // namespace Packages
