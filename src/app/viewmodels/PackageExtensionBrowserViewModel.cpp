// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/viewmodels/PackageExtensionBrowserViewModel.hpp"

#include "app/models/SelectableListModel.hpp"

#include <packages/ExtensionSteps.hpp>
#include <packages/ExtensionSynchronizer.hpp>
#include <packages/IExtensionManager.hpp>

#include <QtCore/QDir>
#include <QtCore/QPointer>

#include <utility>

using namespace Qt::StringLiterals;

namespace Kiln::ViewModels {

using Packages::InstalledPackageExtension;
using Packages::PackageExtension;

namespace {

QString availableDetail(const PackageExtension& ext)
{
    QStringList lines;
    if (!ext.author.isEmpty())
        lines.push_back(u"by "_s + ext.author);
    if (!ext.description.isEmpty())
        lines.push_back(ext.description);
    if (!ext.reference.isEmpty())
        lines.push_back(ext.reference);
    return lines.join(u'\n');
}

QString installedDetail(const InstalledPackageExtension& ext)
{
    QStringList lines;
    for (const QString& path : ext.paths)
        lines.push_back(QDir::toNativeSeparators(path));
    if (ext.gitRepositoryUrl)
        lines.push_back(*ext.gitRepositoryUrl);
    if (ext.version)
        lines.push_back(u"Version %1"_s.arg(ext.version->left(12)));
    return lines.join(u'\n');
}

} // namespace

PackageExtensionBrowserViewModel::PackageExtensionBrowserViewModel(QObject* parent)
    : QObject(parent)
    , m_availableCache([](const PackageExtension& ext) { return ext.identity(); })
    , m_installedCache([](const InstalledPackageExtension& ext) { return ext.identity(); })
{
    m_availableItems = std::make_unique<AvailableItems>(m_availableCache, [](const QString& query) {
        return AvailableItems::Predicate([query](const PackageExtension& ext) {
            return ext.title.contains(query, Qt::CaseInsensitive);
        });
    });
    m_installedItems = std::make_unique<InstalledItems>(m_installedCache, [](const QString& query) {
        return InstalledItems::Predicate([query](const InstalledPackageExtension& ext) {
            return ext.title().contains(query, Qt::CaseInsensitive);
        });
    });

    m_availableModel = new Models::SelectableListModel(
        Models::SelectableListModel::sourceFor<PackageExtension, QString>(
            *m_availableItems,
            [](const PackageExtension& ext) { return ext.title; },
            availableDetail,
            [](const PackageExtension& ext) { return ext.identity(); }),
        this);
    m_installedModel = new Models::SelectableListModel(
        Models::SelectableListModel::sourceFor<InstalledPackageExtension, QString>(
            *m_installedItems,
            [](const InstalledPackageExtension& ext) { return ext.title(); },
            installedDetail,
            [](const InstalledPackageExtension& ext) { return ext.identity(); }),
        this);

    m_subscriptions.push_back(m_availableItems->onFilterChanged([this]() { m_availableModel->reload(); }));
    m_subscriptions.push_back(m_installedItems->onFilterChanged([this]() { m_installedModel->reload(); }));
    m_subscriptions.push_back(m_availableItems->onSelectionChanged([this]() {
        m_availableModel->refreshSelection();
        emit selectionChanged();
    }));
    m_subscriptions.push_back(m_installedItems->onSelectionChanged([this]() {
        m_installedModel->refreshSelection();
        emit selectionChanged();
    }));
}

PackageExtensionBrowserViewModel::~PackageExtensionBrowserViewModel()
{
    m_subscriptions.clear();
    delete m_availableModel;
    delete m_installedModel;
}

void PackageExtensionBrowserViewModel::setPackagePair(std::optional<Packages::PackagePair> pair)
{
    // Results of a refresh for the previous package are dropped.
    ++m_refreshGeneration;
    setLoading(false);

    m_packagePair = std::move(pair);
    m_availableCache.clear();
    m_installedCache.clear();
    emit packagePairChanged();
}

void PackageExtensionBrowserViewModel::setSearchQuery(const QString& query)
{
    if (query == m_searchQuery)
        return;
    m_searchQuery = query;
    m_availableItems->setQuery(query);
    m_installedItems->setQuery(query);
    emit searchQueryChanged(query);
}

void PackageExtensionBrowserViewModel::addExtensions(const QVector<PackageExtension>& available,
                                                     const QVector<InstalledPackageExtension>& installed)
{
    m_availableCache.addOrUpdate(available);
    m_installedCache.addOrUpdate(installed);
}

void PackageExtensionBrowserViewModel::synchronizeCaches()
{
    const Packages::SynchronizedExtensions synced =
        Packages::ExtensionSynchronizer::synchronize(m_availableCache.items(), m_installedCache.items());
    m_availableCache.editDiff(synced.available);
    m_installedCache.editDiff(synced.installed);
}

Utils::Result PackageExtensionBrowserViewModel::unsupportedResult() const
{
    const QString name = m_packagePair->packageName.isEmpty() ? m_packagePair->installed.displayName
                                                              : m_packagePair->packageName;
    return Utils::Result::unsupported(u"The package %1 does not support extensions."_s.arg(name));
}

Utils::Result PackageExtensionBrowserViewModel::refresh()
{
    if (!m_packagePair)
        return Utils::Result::success();

    Packages::IExtensionManager* manager = m_packagePair->extensionManager.data();
    if (!manager)
        return unsupportedResult();

    const quint64 generation = ++m_refreshGeneration;
    const Packages::InstalledPackage package = m_packagePair->installed;
    const QPointer<PackageExtensionBrowserViewModel> self(this);
    const QPointer<Packages::IExtensionManager> managerGuard(manager);

    setLoading(true);

    // Runs once the last callback holding it is gone, so no path leaves the flag set.
    auto loading = std::make_shared<Utils::Subscription>([self, generation]() {
        if (self && self->m_refreshGeneration == generation)
            self->setLoading(false);
    });

    manager->fetchManifestExtensions(
        manager->manifests(package),
        [self, managerGuard, package, generation, loading](const QVector<PackageExtension>& available,
                                                           const Utils::Result& manifestResult) {
        if (!self || self->m_refreshGeneration != generation)
            return;
        if (!manifestResult) {
            loading->reset();
            emit self->refreshFailed(manifestResult.message());
            return;
        }
        if (!managerGuard) {
            loading->reset();
            return;
        }

        managerGuard->fetchInstalledExtensions(
            package,
            [self, available, generation, loading](const QVector<InstalledPackageExtension>& installed,
                                                   const Utils::Result& installedResult) {
            if (!self || self->m_refreshGeneration != generation)
                return;
            if (!installedResult) {
                loading->reset();
                emit self->refreshFailed(installedResult.message());
                return;
            }
            self->applyFetched(generation, available, installed);
            loading->reset();
        });
    });

    return Utils::Result::success();
}

void PackageExtensionBrowserViewModel::applyFetched(quint64 generation,
                                                    const QVector<PackageExtension>& available,
                                                    const QVector<InstalledPackageExtension>& installed)
{
    if (generation != m_refreshGeneration)
        return;

    const Packages::SynchronizedExtensions synced = Packages::ExtensionSynchronizer::synchronize(available, installed);
    m_availableCache.editDiff(synced.available);
    m_installedCache.editDiff(synced.installed);

    qCDebug(applog) << "Extensions refreshed:" << m_availableCache.count() << "available,"
                    << m_installedCache.count() << "installed";
    emit refreshed();
}

Utils::Result PackageExtensionBrowserViewModel::installSelectedExtensions()
{
    if (!m_packagePair)
        return Utils::Result::success();
    Packages::IExtensionManager* manager = m_packagePair->extensionManager.data();
    if (!manager)
        return unsupportedResult();

    const QVector<PackageExtension> selected = m_availableItems->selectedValues();
    if (selected.isEmpty())
        return Utils::Result::success();

    Packages::PackageModificationRunner::Steps steps;
    for (const PackageExtension& ext : selected)
        steps.push_back(std::make_unique<Packages::InstallExtensionStep>(manager, m_packagePair->installed, ext));
    runSteps(std::move(steps));
    return Utils::Result::success();
}

Utils::Result PackageExtensionBrowserViewModel::uninstallSelectedExtensions()
{
    if (!m_packagePair)
        return Utils::Result::success();
    Packages::IExtensionManager* manager = m_packagePair->extensionManager.data();
    if (!manager)
        return unsupportedResult();

    const QVector<InstalledPackageExtension> selected = m_installedItems->selectedValues();
    if (selected.isEmpty())
        return Utils::Result::success();

    Packages::PackageModificationRunner::Steps steps;
    for (const InstalledPackageExtension& ext : selected)
        steps.push_back(std::make_unique<Packages::UninstallExtensionStep>(manager, m_packagePair->installed, ext));
    runSteps(std::move(steps));
    return Utils::Result::success();
}

void PackageExtensionBrowserViewModel::runSteps(Packages::PackageModificationRunner::Steps steps)
{
    auto* runner = new Packages::PackageModificationRunner(this);
    runner->setShowDialogOnStart(true);

    connect(runner, &Packages::PackageModificationRunner::finished, this, [this, runner](const Utils::Result& result) {
        if (!result)
            qCWarning(applog) << "Extension modification failed:" << result.message();

        // Whatever the outcome, the disk may have changed.
        clearSelection();
        if (const Utils::Result refreshed = refresh(); !refreshed)
            emit refreshFailed(refreshed.message());
        runner->deleteLater();
    });

    emit modificationRunnerStarted(runner);
    runner->executeSteps(std::move(steps));
}

void PackageExtensionBrowserViewModel::clearSelection()
{
    m_availableItems->clearSelection();
    m_installedItems->clearSelection();
}

void PackageExtensionBrowserViewModel::setLoading(bool loading)
{
    if (loading == m_loading)
        return;
    m_loading = loading;
    emit isLoadingChanged(loading);
}

} // namespace Kiln::ViewModels
