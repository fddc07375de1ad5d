// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <utils/Result.hpp>

#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

class QLabel;
class QLineEdit;
class QListView;
class QPushButton;

namespace Packages {
class PackageModificationRunner;
}

namespace Utils::Async {
class Debouncer;
}

namespace Kiln::ViewModels {
class PackageExtensionBrowserViewModel;
}

namespace Kiln::Views {

class ExtensionBrowserPanel final : public QWidget
{
    Q_OBJECT

public:
    explicit ExtensionBrowserPanel(ViewModels::PackageExtensionBrowserViewModel* viewModel,
                                   QWidget* parent = nullptr);

    static constexpr int kSearchDebounceMs = 300;

private:
    void buildUi();
    void bindViewModel();
    void syncActions();
    void report(const Utils::Result& result);
    void trackRunner(Packages::PackageModificationRunner* runner);

    QPointer<ViewModels::PackageExtensionBrowserViewModel> m_viewModel;
    Utils::Async::Debouncer* m_searchDebounce = nullptr;

    QLineEdit* m_searchEdit = nullptr;
    QLabel* m_packageLabel = nullptr;
    QLabel* m_loadingLabel = nullptr;
    QLabel* m_statusLabel = nullptr;
    QListView* m_availableView = nullptr;
    QListView* m_installedView = nullptr;
    QPushButton* m_installButton = nullptr;
    QPushButton* m_uninstallButton = nullptr;
    QPushButton* m_refreshButton = nullptr;
    QPushButton* m_clearButton = nullptr;
};

} // namespace Kiln::Views
