// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/settings/AppEnvironment.hpp"

namespace Kiln::Settings {

Utils::Environment makeEnvironment(const QString& configRoot)
{
    Utils::EnvironmentConfig cfg;
    cfg.organizationName = QStringLiteral("Kiln");
    cfg.applicationName = QStringLiteral("Kiln");
    cfg.configRootOverride = configRoot;
    return Utils::Environment(cfg);
}

} // namespace Kiln::Settings
