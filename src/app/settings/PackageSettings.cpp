// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/settings/PackageSettings.hpp"

#include <QtCore/QDir>

namespace Kiln::Settings {

namespace {

using namespace Qt::StringLiterals;

const QString kNameKey = u"packages/name"_s;
const QString kRootKey = u"packages/rootPath"_s;
const QString kExtensionDirKey = u"packages/extensionDirName"_s;
const QString kManifestsKey = u"packages/manifestLocations"_s;

} // namespace

QStringList PackageSettings::defaultManifestLocations()
{
    return {u"https://raw.githubusercontent.com/ltdrdata/ComfyUI-Manager/main/custom-node-list.json"_s};
}

Packages::InstalledPackage PackageSettings::installedPackage() const
{
    Packages::InstalledPackage package;
    package.displayName = packageName;
    package.rootPath = QDir::cleanPath(rootPath.trimmed());
    package.extensionDirName = extensionDirName;
    return package;
}

PackageSettings PackageSettings::load(const Utils::Environment& env)
{
    PackageSettings settings;
    settings.packageName = env.stringValue(kNameKey, settings.packageName).trimmed();
    settings.rootPath = env.stringValue(kRootKey).trimmed();

    const QString dirName = env.stringValue(kExtensionDirKey, settings.extensionDirName).trimmed();
    if (!dirName.isEmpty() && !dirName.contains(u'/') && !dirName.contains(u'\\'))
        settings.extensionDirName = dirName;

    if (env.contains(kManifestsKey))
        settings.manifestLocations = env.stringListValue(kManifestsKey);
    return settings;
}

void PackageSettings::save(Utils::Environment& env) const
{
    env.setValue(kNameKey, packageName);
    env.setValue(kRootKey, rootPath);
    env.setValue(kExtensionDirKey, extensionDirName);
    env.setValue(kManifestsKey, manifestLocations);
}

} // namespace Kiln::Settings
