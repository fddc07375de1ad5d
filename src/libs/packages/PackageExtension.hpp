// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "packages/PackagesGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>

namespace Packages {

enum class InstallType : unsigned char {
    Unknown,
    GitClone,
    Copy,
    Unzip
};

PACKAGES_EXPORT InstallType installTypeFromString(const QString& value);
PACKAGES_EXPORT QString installTypeToString(InstallType type);

// An extension advertised by a manifest.
struct PACKAGES_EXPORT PackageExtension final {
    QString author;
    QString title;
    QString reference;
    QStringList files;
    QString description;
    InstallType installType = InstallType::Unknown;

    bool operator==(const PackageExtension&) const = default;

    QString identity() const { return author + title + reference; }

    // One entry of a ComfyUI-Manager style "custom_nodes" array. Returns nullopt for entries
    // without a title or without any file.
    static std::optional<PackageExtension> fromManifestEntry(const QJsonObject& entry);
};

// An extension present in a package's extension directory.
struct PACKAGES_EXPORT InstalledPackageExtension final {
    QStringList paths;
    std::optional<QString> gitRepositoryUrl;
    std::optional<QString> version;

    // The manifest entry this installation was matched to; never part of the identity.
    std::optional<PackageExtension> definition;

    bool operator==(const InstalledPackageExtension&) const = default;

    // First path, else repository URL, else "installed:<sha1 of installedName() and version>".
    QString identity() const;

    // Definition title, else the directory name of the first path, else the repository name.
    QString title() const;

    // Directory name of the first path, else the repository name. Ignores the definition.
    QString installedName() const;

    InstalledPackageExtension withDefinition(std::optional<PackageExtension> value) const;
};

} // namespace Packages

Q_DECLARE_METATYPE(Packages::PackageExtension)
Q_DECLARE_METATYPE(Packages::InstalledPackageExtension)
