// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <utils/Environment.hpp>

#include <QtCore/QString>
#include <QtCore/QUrl>

namespace Kiln::Settings {

struct APP_EXPORT InferenceSettings final {
    QUrl baseUrl = QUrl(QStringLiteral("http://127.0.0.1:8188"));

    // The backend's output folder on this machine; empty when outputs are only reachable by URL.
    QString outputImagesDir;

    bool connectOnStart = false;

    bool operator==(const InferenceSettings&) const = default;

    static InferenceSettings load(const Utils::Environment& env);
    void save(Utils::Environment& env) const;
};

} // namespace Kiln::Settings
