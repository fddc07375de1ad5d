// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <QtCore/QString>

namespace Kiln::Services {

// Transient, non-blocking user notices.
class APP_EXPORT INotificationService
{
public:
    enum class Severity : unsigned char {
        Information,
        Success,
        Warning,
        Error
    };

    virtual ~INotificationService() = default;

    virtual void show(const QString& title, const QString& message, Severity severity = Severity::Information) = 0;
};

} // namespace Kiln::Services
