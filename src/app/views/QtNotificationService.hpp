// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/services/INotificationService.hpp"

#include <QtCore/QPointer>
#include <QtWidgets/QStatusBar>

namespace Kiln::Views {

// Shows notices in a status bar; they expire after a few seconds.
class QtNotificationService final : public Services::INotificationService
{
public:
    explicit QtNotificationService(QStatusBar* statusBar);

    void show(const QString& title, const QString& message, Severity severity = Severity::Information) override;

    static int timeoutFor(Severity severity);

private:
    QPointer<QStatusBar> m_statusBar;
};

} // namespace Kiln::Views
