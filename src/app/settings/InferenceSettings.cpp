// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/settings/InferenceSettings.hpp"

namespace Kiln::Settings {

namespace {

using namespace Qt::StringLiterals;

const QString kBaseUrlKey = u"inference/baseUrl"_s;
const QString kOutputDirKey = u"inference/outputImagesDir"_s;
const QString kConnectOnStartKey = u"inference/connectOnStart"_s;

} // namespace

InferenceSettings InferenceSettings::load(const Utils::Environment& env)
{
    InferenceSettings settings;

    const QUrl url = QUrl::fromUserInput(env.stringValue(kBaseUrlKey, settings.baseUrl.toString()));
    if (url.isValid() && !url.host().isEmpty())
        settings.baseUrl = url;
    else
        qCWarning(applog) << "Ignoring invalid backend URL setting" << url;

    settings.outputImagesDir = env.stringValue(kOutputDirKey).trimmed();
    settings.connectOnStart = env.value(kConnectOnStartKey, false).toBool();
    return settings;
}

void InferenceSettings::save(Utils::Environment& env) const
{
    env.setValue(kBaseUrlKey, baseUrl.toString());
    env.setValue(kOutputDirKey, outputImagesDir);
    env.setValue(kConnectOnStartKey, connectOnStart);
}

} // namespace Kiln::Settings
