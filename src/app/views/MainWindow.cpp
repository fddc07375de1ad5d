// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/views/MainWindow.hpp"

#include "app/viewmodels/InferenceTextToImageViewModel.hpp"
#include "app/viewmodels/PackageExtensionBrowserViewModel.hpp"
#include "app/views/ExtensionBrowserPanel.hpp"
#include "app/views/InferencePanel.hpp"
#include "app/views/QtNotificationService.hpp"

#include <inference/InferenceClientManager.hpp>

#include <QtWidgets/QStatusBar>
#include <QtWidgets/QTabWidget>

using namespace Qt::StringLiterals;

namespace Kiln::Views {

using Severity = Services::INotificationService::Severity;

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_tabs(new QTabWidget(this))
    , m_notifications(std::make_unique<QtNotificationService>(statusBar()))
{
    setWindowTitle(u"Kiln"_s);
    resize(1280, 820);
    m_tabs->setDocumentMode(true);
    setCentralWidget(m_tabs);
}

MainWindow::~MainWindow() = default;

void MainWindow::setViewModels(ViewModels::InferenceTextToImageViewModel* inference,
                               ViewModels::PackageExtensionBrowserViewModel* extensions)
{
    if (m_inferencePanel || m_extensionPanel)
        return;

    if (inference) {
        m_inferencePanel = new InferencePanel(inference, m_tabs);
        m_tabs->addTab(m_inferencePanel, u"Text to Image"_s);

        connect(inference, &ViewModels::InferenceTextToImageViewModel::generationFailed, this,
                [this](const QString& message) {
                    m_notifications->show(u"Generation failed"_s, message, Severity::Error);
                });
        if (auto* manager = inference->clientManager()) {
            connect(manager, &Inference::InferenceClientManager::connectionFailed, this,
                    [this](const QString& message) {
                        m_notifications->show(u"Connection failed"_s, message, Severity::Error);
                    });
            connect(manager, &Inference::InferenceClientManager::isConnectedChanged, this, [this](bool connected) {
                if (connected)
                    m_notifications->show(u"Connected"_s, u"Backend is ready"_s, Severity::Success);
            });
        }
    }

    if (extensions) {
        m_extensionPanel = new ExtensionBrowserPanel(extensions, m_tabs);
        m_tabs->addTab(m_extensionPanel, u"Extensions"_s);

        connect(extensions, &ViewModels::PackageExtensionBrowserViewModel::refreshFailed, this,
                [this](const QString& message) {
                    m_notifications->show(u"Failed to load extensions"_s, message, Severity::Warning);
                });
    }
}

} // namespace Kiln::Views
