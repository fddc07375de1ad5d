// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "packages/PackageExtension.hpp"

#include <QtCore/QCryptographicHash>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QUrl>

using namespace Qt::StringLiterals;

namespace Packages {

namespace {

QString stripGit(QString value)
{
    if (value.endsWith(".git"_L1))
        value.chop(4);
    return value;
}

} // namespace

InstallType installTypeFromString(const QString& value)
{
    const QString v = value.trimmed().toLower();
    if (v == "git-clone"_L1)
        return InstallType::GitClone;
    if (v == "copy"_L1)
        return InstallType::Copy;
    if (v == "unzip"_L1)
        return InstallType::Unzip;
    return InstallType::Unknown;
}

QString installTypeToString(InstallType type)
{
    switch (type) {
    case InstallType::GitClone: return u"git-clone"_s;
    case InstallType::Copy:     return u"copy"_s;
    case InstallType::Unzip:    return u"unzip"_s;
    case InstallType::Unknown:  break;
    }
    return u"unknown"_s;
}

std::optional<PackageExtension> PackageExtension::fromManifestEntry(const QJsonObject& entry)
{
    PackageExtension ext;
    ext.author = entry.value("author"_L1).toString().trimmed();
    ext.title = entry.value("title"_L1).toString().trimmed();
    ext.reference = entry.value("reference"_L1).toString().trimmed();
    ext.description = entry.value("description"_L1).toString();
    ext.installType = installTypeFromString(entry.value("install_type"_L1).toString());

    for (const QJsonValue& file : entry.value("files"_L1).toArray()) {
        const QString f = file.toString().trimmed();
        if (!f.isEmpty())
            ext.files.push_back(f);
    }

    if (ext.title.isEmpty() || ext.files.isEmpty())
        return std::nullopt;
    return ext;
}

QString InstalledPackageExtension::identity() const
{
    if (!paths.isEmpty())
        return paths.first();
    if (gitRepositoryUrl && !gitRepositoryUrl->isEmpty())
        return *gitRepositoryUrl;

    QCryptographicHash hash(QCryptographicHash::Sha1);
    hash.addData(installedName().toUtf8());
    hash.addData(QByteArrayView("\n"));
    hash.addData(version.value_or(QString()).toUtf8());
    return u"installed:"_s + QString::fromLatin1(hash.result().toHex());
}

QString InstalledPackageExtension::title() const
{
    return definition ? definition->title : installedName();
}

QString InstalledPackageExtension::installedName() const
{
    if (!paths.isEmpty())
        return QFileInfo(paths.first()).fileName();
    if (gitRepositoryUrl)
        return stripGit(QUrl(*gitRepositoryUrl).fileName());
    return {};
}

InstalledPackageExtension InstalledPackageExtension::withDefinition(std::optional<PackageExtension> value) const
{
    InstalledPackageExtension copy = *this;
    copy.definition = std::move(value);
    return copy;
}

} // namespace Packages
