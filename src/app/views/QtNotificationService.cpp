// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/views/QtNotificationService.hpp"

using namespace Qt::StringLiterals;

namespace Kiln::Views {

QtNotificationService::QtNotificationService(QStatusBar* statusBar)
    : m_statusBar(statusBar)
{}

int QtNotificationService::timeoutFor(Severity severity)
{
    switch (severity) {
    case Severity::Information:
    case Severity::Success:
        return 4000;
    case Severity::Warning:
        return 6000;
    case Severity::Error:
        return 10000;
    }
    return 4000;
}

void QtNotificationService::show(const QString& title, const QString& message, Severity severity)
{
    const QString text = message.isEmpty() ? title : u"%1: %2"_s.arg(title, message);
    if (severity == Severity::Error)
        qCWarning(applog).noquote() << text;
    else
        qCInfo(applog).noquote() << text;

    if (m_statusBar)
        m_statusBar->showMessage(text, timeoutFor(severity));
}

} // namespace Kiln::Views
