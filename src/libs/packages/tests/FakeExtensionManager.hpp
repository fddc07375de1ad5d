// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/IExtensionManager.hpp"

#include <QtCore/QDir>
#include <QtCore/QSet>

namespace Packages::Testing {

// Answers every call synchronously from scripted data. Successful installs and removals edit
// `installed`, so a following fetch reflects them.
class FakeExtensionManager final : public IExtensionManager
{
public:
    using IExtensionManager::IExtensionManager;

    QVector<QUrl> manifestUrls{QUrl(QStringLiteral("https://example.test/custom-node-list.json"))};
    QVector<PackageExtension> available;
    QVector<InstalledPackageExtension> installed;

    QString manifestError;
    QString installedError;
    QSet<QString> failingTitles;

    int manifestFetches = 0;
    int installedFetches = 0;
    QStringList installCalls;
    QStringList uninstallCalls;
    QVector<QUrl> lastManifestRequest;

    QVector<QUrl> manifests(const InstalledPackage&) const override { return manifestUrls; }

    void fetchManifestExtensions(const QVector<QUrl>& manifests, ManifestCallback done) override
    {
        ++manifestFetches;
        lastManifestRequest = manifests;
        if (!manifestError.isEmpty()) {
            done({}, Utils::Result::failure(manifestError));
            return;
        }
        done(available, Utils::Result::success());
    }

    void fetchInstalledExtensions(const InstalledPackage&, InstalledCallback done) override
    {
        ++installedFetches;
        if (!installedError.isEmpty()) {
            done({}, Utils::Result::failure(installedError));
            return;
        }
        done(installed, Utils::Result::success());
    }

    void installExtension(const InstalledPackage& package,
                          const PackageExtension& extension,
                          const Utils::Async::CancellationToken&,
                          ProgressCallback progress,
                          DoneCallback done) override
    {
        installCalls.push_back(extension.title);
        if (progress)
            progress(ProgressReport::indeterminate(QStringLiteral("Installing ") + extension.title, extension.reference));
        if (failingTitles.contains(extension.title)) {
            done(Utils::Result::failure(QStringLiteral("clone of %1 failed").arg(extension.title)));
            return;
        }

        InstalledPackageExtension ext;
        ext.paths.push_back(QDir(package.extensionsPath()).filePath(extension.title));
        if (!extension.files.isEmpty())
            ext.gitRepositoryUrl = extension.files.first();
        installed.push_back(ext);
        done(Utils::Result::success());
    }

    void uninstallExtension(const InstalledPackage&,
                            const InstalledPackageExtension& extension,
                            const Utils::Async::CancellationToken&,
                            ProgressCallback progress,
                            DoneCallback done) override
    {
        uninstallCalls.push_back(extension.title());
        if (progress)
            progress(ProgressReport{0.5, QStringLiteral("Uninstalling ") + extension.title(), extension.identity()});
        if (failingTitles.contains(extension.title())) {
            done(Utils::Result::failure(QStringLiteral("removal of %1 failed").arg(extension.title())));
            return;
        }

        installed.removeIf([&](const InstalledPackageExtension& e) { return e.identity() == extension.identity(); });
        done(Utils::Result::success());
    }
};

} // namespace Packages::Testing
