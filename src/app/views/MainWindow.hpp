// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtWidgets/QMainWindow>

#include <memory>

class QTabWidget;

namespace Kiln::ViewModels {
class InferenceTextToImageViewModel;
class PackageExtensionBrowserViewModel;
}

namespace Kiln::Views {

class InferencePanel;
class ExtensionBrowserPanel;
class QtNotificationService;

class MainWindow final : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // Available before the view models exist so they can report through it.
    QtNotificationService* notifications() const noexcept { return m_notifications.get(); }

    void setViewModels(ViewModels::InferenceTextToImageViewModel* inference,
                       ViewModels::PackageExtensionBrowserViewModel* extensions);

    InferencePanel* inferencePanel() const noexcept { return m_inferencePanel; }
    ExtensionBrowserPanel* extensionPanel() const noexcept { return m_extensionPanel; }

private:
    QTabWidget* m_tabs = nullptr;
    InferencePanel* m_inferencePanel = nullptr;
    ExtensionBrowserPanel* m_extensionPanel = nullptr;
    std::unique_ptr<QtNotificationService> m_notifications;
};

} // namespace Kiln::Views
