// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <packages/InstalledPackage.hpp>
#include <packages/PackageExtension.hpp>
#include <packages/PackageModificationRunner.hpp>
#include <utils/Result.hpp>
#include <utils/Subscription.hpp>
#include <utils/reactive/SelectableCollection.hpp>
#include <utils/reactive/SourceCache.hpp>

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <memory>
#include <optional>
#include <vector>

namespace Kiln::Models {
class SelectableListModel;
}

namespace Kiln::ViewModels {

// Available and installed extensions of one package, each kept in a keyed cache and projected
// into a searchable, selectable list.
class APP_EXPORT PackageExtensionBrowserViewModel final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool isLoading READ isLoading NOTIFY isLoadingChanged)
    Q_PROPERTY(QString searchQuery READ searchQuery WRITE setSearchQuery NOTIFY searchQueryChanged)
    Q_PROPERTY(int selectedAvailableCount READ selectedAvailableCount NOTIFY selectionChanged)
    Q_PROPERTY(int selectedInstalledCount READ selectedInstalledCount NOTIFY selectionChanged)

public:
    using AvailableCache = Utils::Reactive::SourceCache<Packages::PackageExtension, QString>;
    using InstalledCache = Utils::Reactive::SourceCache<Packages::InstalledPackageExtension, QString>;
    using AvailableItems = Utils::Reactive::SelectableCollection<Packages::PackageExtension, QString>;
    using InstalledItems = Utils::Reactive::SelectableCollection<Packages::InstalledPackageExtension, QString>;

    explicit PackageExtensionBrowserViewModel(QObject* parent = nullptr);
    ~PackageExtensionBrowserViewModel() override;

    const std::optional<Packages::PackagePair>& packagePair() const noexcept { return m_packagePair; }
    void setPackagePair(std::optional<Packages::PackagePair> pair);

    AvailableCache& availableCache() noexcept { return m_availableCache; }
    InstalledCache& installedCache() noexcept { return m_installedCache; }
    AvailableItems& availableItems() noexcept { return *m_availableItems; }
    InstalledItems& installedItems() noexcept { return *m_installedItems; }

    Models::SelectableListModel* availableModel() const noexcept { return m_availableModel; }
    Models::SelectableListModel* installedModel() const noexcept { return m_installedModel; }

    bool isLoading() const noexcept { return m_loading; }
    QString searchQuery() const { return m_searchQuery; }
    int selectedAvailableCount() const { return int(m_availableItems->selectedItems().size()); }
    int selectedInstalledCount() const { return int(m_installedItems->selectedItems().size()); }

    void addExtensions(const QVector<Packages::PackageExtension>& available,
                       const QVector<Packages::InstalledPackageExtension>& installed);

    // Re-attaches definitions using what the caches hold now.
    void synchronizeCaches();

public slots:
    void setSearchQuery(const QString& query);

    // Succeeds without effect when no package is attached. Fails as unsupported when the package
    // has no extension manager. Fetch errors arrive later through refreshFailed().
    Utils::Result refresh();

    Utils::Result installSelectedExtensions();
    Utils::Result uninstallSelectedExtensions();
    void clearSelection();

signals:
    void isLoadingChanged(bool loading);
    void searchQueryChanged(const QString& query);
    void selectionChanged();
    void packagePairChanged();

    // The host shows progress for the runner; it is deleted some time after it finishes.
    void modificationRunnerStarted(Packages::PackageModificationRunner* runner);
    void refreshFailed(const QString& message);
    void refreshed();

private:
    void runSteps(Packages::PackageModificationRunner::Steps steps);
    void applyFetched(quint64 generation,
                      const QVector<Packages::PackageExtension>& available,
                      const QVector<Packages::InstalledPackageExtension>& installed);
    void setLoading(bool loading);
    Utils::Result unsupportedResult() const;

    std::optional<Packages::PackagePair> m_packagePair;

    AvailableCache m_availableCache;
    InstalledCache m_installedCache;
    std::unique_ptr<AvailableItems> m_availableItems;
    std::unique_ptr<InstalledItems> m_installedItems;

    Models::SelectableListModel* m_availableModel = nullptr;
    Models::SelectableListModel* m_installedModel = nullptr;
    std::vector<Utils::Subscription> m_subscriptions;

    QString m_searchQuery;
    bool m_loading = false;
    quint64 m_refreshGeneration = 0;
};

} // namespace Kiln::ViewModels
