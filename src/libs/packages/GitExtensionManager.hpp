// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/IExtensionManager.hpp"
#include "packages/PackagesGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QStringList>
#include <QtNetwork/QNetworkAccessManager>

namespace Packages {

// Extension manager for packages whose extensions are git checkouts in one directory, listed by
// ComfyUI-Manager style manifests.
class PACKAGES_EXPORT GitExtensionManager final : public IExtensionManager
{
    Q_OBJECT

public:
    static constexpr int kManifestTimeoutMs = 30000;

    explicit GitExtensionManager(QStringList manifestLocations, QObject* parent = nullptr);

    QStringList manifestLocations() const { return m_manifestLocations; }
    void setManifestLocations(QStringList locations) { m_manifestLocations = std::move(locations); }

    QString gitProgram() const { return m_gitProgram; }
    void setGitProgram(QString program) { m_gitProgram = std::move(program); }

    QVector<QUrl> manifests(const InstalledPackage& package) const override;

    void fetchManifestExtensions(const QVector<QUrl>& manifests, ManifestCallback done) override;
    void fetchInstalledExtensions(const InstalledPackage& package, InstalledCallback done) override;

    void installExtension(const InstalledPackage& package,
                          const PackageExtension& extension,
                          const Utils::Async::CancellationToken& token,
                          ProgressCallback progress,
                          DoneCallback done) override;

    void uninstallExtension(const InstalledPackage& package,
                            const InstalledPackageExtension& extension,
                            const Utils::Async::CancellationToken& token,
                            ProgressCallback progress,
                            DoneCallback done) override;

    // {"custom_nodes": [...]}. Entries without a title or files are skipped.
    static QVector<PackageExtension> parseManifest(const QJsonObject& manifest, QString* error = nullptr);

    // One entry per directory under `extensionsPath`, hidden and cache directories excluded.
    static QVector<InstalledPackageExtension> scanInstalledExtensions(const QString& extensionsPath);

    // Directory a clone of `extension` lands in.
    static QString cloneTargetFor(const InstalledPackage& package, const PackageExtension& extension);

private:
    using SourceCallback = std::function<void(const QVector<PackageExtension>&, const QString& error)>;

    void fetchManifest(const QUrl& url, SourceCallback done);

    QStringList m_manifestLocations;
    QString m_gitProgram = QStringLiteral("git");
    QNetworkAccessManager m_network;
};

} // namespace Packages
