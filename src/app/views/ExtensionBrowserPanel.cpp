// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/views/ExtensionBrowserPanel.hpp"

#include "app/AppGlobal.hpp"
#include "app/models/SelectableListModel.hpp"
#include "app/viewmodels/PackageExtensionBrowserViewModel.hpp"

#include <packages/PackageModificationRunner.hpp>
#include <utils/async/Debouncer.hpp>

#include <QtCore/QLoggingCategory>
#include <QtWidgets/QGroupBox>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QListView>
#include <QtWidgets/QProgressDialog>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QVBoxLayout>

#include <cmath>

using namespace Qt::StringLiterals;

namespace Kiln::Views {

namespace {

QListView* makeExtensionList(QWidget* parent)
{
    auto* view = new QListView(parent);
    view->setSelectionMode(QAbstractItemView::NoSelection);
    view->setAlternatingRowColors(true);
    view->setUniformItemSizes(true);
    return view;
}

} // namespace

ExtensionBrowserPanel::ExtensionBrowserPanel(ViewModels::PackageExtensionBrowserViewModel* viewModel,
                                             QWidget* parent)
    : QWidget(parent)
    , m_viewModel(viewModel)
{
    buildUi();
    bindViewModel();
    syncActions();
}

void ExtensionBrowserPanel::buildUi()
{
    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(8, 8, 8, 8);
    root->setSpacing(8);

    auto* topRow = new QHBoxLayout();
    m_packageLabel = new QLabel(this);
    m_searchEdit = new QLineEdit(this);
    m_searchEdit->setPlaceholderText(u"Search extensions"_s);
    m_searchEdit->setClearButtonEnabled(true);
    m_loadingLabel = new QLabel(u"Loading..."_s, this);
    m_loadingLabel->setVisible(false);
    m_refreshButton = new QPushButton(u"Refresh"_s, this);
    topRow->addWidget(m_packageLabel);
    topRow->addWidget(m_searchEdit, 1);
    topRow->addWidget(m_loadingLabel);
    topRow->addWidget(m_refreshButton);
    root->addLayout(topRow);

    auto* lists = new QHBoxLayout();

    auto* availableGroup = new QGroupBox(u"Available"_s, this);
    auto* availableLayout = new QVBoxLayout(availableGroup);
    m_availableView = makeExtensionList(availableGroup);
    m_installButton = new QPushButton(u"Install"_s, availableGroup);
    availableLayout->addWidget(m_availableView, 1);
    availableLayout->addWidget(m_installButton);

    auto* installedGroup = new QGroupBox(u"Installed"_s, this);
    auto* installedLayout = new QVBoxLayout(installedGroup);
    m_installedView = makeExtensionList(installedGroup);
    m_uninstallButton = new QPushButton(u"Uninstall"_s, installedGroup);
    installedLayout->addWidget(m_installedView, 1);
    installedLayout->addWidget(m_uninstallButton);

    lists->addWidget(availableGroup, 1);
    lists->addWidget(installedGroup, 1);
    root->addLayout(lists, 1);

    auto* bottomRow = new QHBoxLayout();
    m_statusLabel = new QLabel(this);
    m_statusLabel->setWordWrap(true);
    m_clearButton = new QPushButton(u"Clear selection"_s, this);
    bottomRow->addWidget(m_statusLabel, 1);
    bottomRow->addWidget(m_clearButton);
    root->addLayout(bottomRow);

    m_searchDebounce = new Utils::Async::Debouncer(kSearchDebounceMs, this);
}

void ExtensionBrowserPanel::bindViewModel()
{
    if (!m_viewModel)
        return;

    ViewModels::PackageExtensionBrowserViewModel* vm = m_viewModel;
    using VM = ViewModels::PackageExtensionBrowserViewModel;

    m_availableView->setModel(vm->availableModel());
    m_installedView->setModel(vm->installedModel());
    m_searchEdit->setText(vm->searchQuery());

    connect(m_searchEdit, &QLineEdit::textChanged, m_searchDebounce, &Utils::Async::Debouncer::push);
    connect(m_searchEdit, &QLineEdit::returnPressed, m_searchDebounce, &Utils::Async::Debouncer::flush);
    connect(m_searchDebounce, &Utils::Async::Debouncer::settled, vm, &VM::setSearchQuery);

    connect(vm, &VM::isLoadingChanged, this, &ExtensionBrowserPanel::syncActions);
    connect(vm, &VM::selectionChanged, this, &ExtensionBrowserPanel::syncActions);
    connect(vm, &VM::packagePairChanged, this, &ExtensionBrowserPanel::syncActions);
    connect(vm, &VM::refreshed, this, [this]() { m_statusLabel->clear(); });
    connect(vm, &VM::refreshFailed, this, [this](const QString& message) {
        m_statusLabel->setText(message);
    });
    connect(vm, &VM::modificationRunnerStarted, this, &ExtensionBrowserPanel::trackRunner);

    connect(m_refreshButton, &QPushButton::clicked, this, [this]() {
        if (m_viewModel)
            report(m_viewModel->refresh());
    });
    connect(m_installButton, &QPushButton::clicked, this, [this]() {
        if (m_viewModel)
            report(m_viewModel->installSelectedExtensions());
    });
    connect(m_uninstallButton, &QPushButton::clicked, this, [this]() {
        if (m_viewModel)
            report(m_viewModel->uninstallSelectedExtensions());
    });
    connect(m_clearButton, &QPushButton::clicked, vm, &VM::clearSelection);
}

void ExtensionBrowserPanel::syncActions()
{
    const bool loading = m_viewModel && m_viewModel->isLoading();
    const bool hasPackage = m_viewModel && m_viewModel->packagePair().has_value();
    const int available = m_viewModel ? m_viewModel->selectedAvailableCount() : 0;
    const int installed = m_viewModel ? m_viewModel->selectedInstalledCount() : 0;

    m_loadingLabel->setVisible(loading);
    m_refreshButton->setEnabled(hasPackage && !loading);
    m_installButton->setEnabled(hasPackage && !loading && available > 0);
    m_uninstallButton->setEnabled(hasPackage && !loading && installed > 0);
    m_clearButton->setEnabled(available > 0 || installed > 0);

    m_installButton->setText(available > 0 ? u"Install (%1)"_s.arg(available) : u"Install"_s);
    m_uninstallButton->setText(installed > 0 ? u"Uninstall (%1)"_s.arg(installed) : u"Uninstall"_s);

    if (hasPackage) {
        const Packages::PackagePair& pair = *m_viewModel->packagePair();
        m_packageLabel->setText(pair.packageName.isEmpty() ? pair.installed.displayName : pair.packageName);
    } else {
        m_packageLabel->setText(u"No package"_s);
    }
}

void ExtensionBrowserPanel::report(const Utils::Result& result)
{
    if (result) {
        m_statusLabel->clear();
        return;
    }
    m_statusLabel->setText(result.message());
}

void ExtensionBrowserPanel::trackRunner(Packages::PackageModificationRunner* runner)
{
    if (!runner)
        return;

    auto* dialog = new QProgressDialog(this);
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    dialog->setWindowTitle(u"Modifying extensions"_s);
    dialog->setRange(0, 100);
    dialog->setMinimumDuration(0);
    dialog->setAutoClose(false);
    dialog->setAutoReset(false);

    connect(runner, &Packages::PackageModificationRunner::stepStarted, dialog,
            [dialog, runner](int index, const QString& title) {
                dialog->setLabelText(u"%1 (%2 of %3)"_s.arg(title).arg(index + 1).arg(runner->stepCount()));
            });
    connect(runner, &Packages::PackageModificationRunner::progressChanged, dialog,
            [dialog](const Packages::ProgressReport& report) {
                if (report.isIndeterminate()) {
                    dialog->setRange(0, 0);
                    return;
                }
                dialog->setRange(0, 100);
                dialog->setValue(int(std::lround(report.progress * 100.0)));
            });
    connect(dialog, &QProgressDialog::canceled, runner, &Packages::PackageModificationRunner::cancel);
    connect(runner, &Packages::PackageModificationRunner::finished, dialog,
            [this, dialog](const Utils::Result& result) {
                if (!result)
                    qCWarning(applog) << "extension modification failed:" << result.message();
                report(result);
                dialog->close();
            });

    if (runner->showDialogOnStart())
        dialog->show();
}

} // namespace Kiln::Views
