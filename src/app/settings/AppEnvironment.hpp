// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <utils/Environment.hpp>

namespace Kiln::Settings {

// `configRoot` replaces the user config directory when set.
APP_EXPORT Utils::Environment makeEnvironment(const QString& configRoot = {});

} // namespace Kiln::Settings
