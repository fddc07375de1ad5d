// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "packages/GitExtensionManager.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>

#include <memory>

using namespace Qt::StringLiterals;
using Packages::GitExtensionManager;
using Packages::InstalledPackage;
using Packages::InstalledPackageExtension;
using Packages::PackageExtension;

namespace {

std::unique_ptr<QCoreApplication> ensureCoreApp()
{
    if (QCoreApplication::instance())
        return {};
    static int argc = 1;
    static char arg0[] = "kiln-packages-tests";
    static char* argv[] = {arg0, nullptr};
    return std::make_unique<QCoreApplication>(argc, argv);
}

bool writeFile(const QString& path, const QByteArray& contents)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(contents) == contents.size();
}

QJsonObject manifest()
{
    return QJsonDocument::fromJson(R"({
        "custom_nodes": [
            {"author": "ltdrdata", "title": "Impact Pack", "reference": "https://github.com/ltdrdata/ComfyUI-Impact-Pack",
             "files": ["https://github.com/ltdrdata/ComfyUI-Impact-Pack"], "install_type": "git-clone",
             "description": "Detectors"},
            {"author": "someone", "title": "Single file", "reference": "https://example.test/node.py",
             "files": ["https://example.test/node.py"], "install_type": "copy"},
            {"author": "broken", "title": "", "files": ["https://example.test/x"]}
        ]
    })").object();
}

InstalledPackage packageAt(const QString& root)
{
    InstalledPackage package;
    package.displayName = u"ComfyUI"_s;
    package.rootPath = root;
    return package;
}

} // namespace

TEST(GitExtensionManagerTests, ParsesManifestAndSkipsIncompleteEntries)
{
    QString error;
    const QVector<PackageExtension> parsed = GitExtensionManager::parseManifest(manifest(), &error);

    EXPECT_TRUE(error.isEmpty());
    ASSERT_EQ(parsed.size(), 2);
    EXPECT_EQ(parsed[0].title, u"Impact Pack"_s);
    EXPECT_EQ(parsed[0].installType, Packages::InstallType::GitClone);
    EXPECT_EQ(parsed[1].installType, Packages::InstallType::Copy);
}

TEST(GitExtensionManagerTests, RejectsManifestWithoutNodeList)
{
    QString error;
    const auto parsed = GitExtensionManager::parseManifest(QJsonObject{{u"nodes"_s, QJsonArray{}}}, &error);

    EXPECT_TRUE(parsed.isEmpty());
    EXPECT_FALSE(error.isEmpty());
}

TEST(GitExtensionManagerTests, ResolvesManifestLocations)
{
    GitExtensionManager manager({u"https://example.test/list.json"_s, u"lists/local.json"_s, u"  "_s});

    const QVector<QUrl> urls = manager.manifests(packageAt(u"/opt/comfy"_s));

    ASSERT_EQ(urls.size(), 2);
    EXPECT_EQ(urls[0], QUrl(u"https://example.test/list.json"_s));
    EXPECT_TRUE(urls[1].isLocalFile());
    EXPECT_EQ(urls[1].toLocalFile(), u"/opt/comfy/lists/local.json"_s);
}

TEST(GitExtensionManagerTests, FetchesLocalManifests)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString path = dir.filePath(u"custom-node-list.json"_s);
    ASSERT_TRUE(Utils::JsonFileUtils::writeObjectAtomic(path, manifest()).ok);

    GitExtensionManager manager({});
    bool called = false;
    QVector<PackageExtension> received;
    Utils::Result result;
    manager.fetchManifestExtensions({QUrl::fromLocalFile(path)},
                                    [&](const QVector<PackageExtension>& extensions, const Utils::Result& r) {
        called = true;
        received = extensions;
        result = r;
    });

    ASSERT_TRUE(called);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(received.size(), 2);
}

TEST(GitExtensionManagerTests, MissingManifestFileFails)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;

    GitExtensionManager manager({});
    Utils::Result result;
    manager.fetchManifestExtensions({QUrl::fromLocalFile(dir.filePath(u"missing.json"_s))},
                                    [&](const QVector<PackageExtension>&, const Utils::Result& r) { result = r; });

    EXPECT_FALSE(result.ok);
}

TEST(GitExtensionManagerTests, ScansInstalledCheckouts)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString nodes = dir.filePath(u"custom_nodes"_s);

    ASSERT_TRUE(writeFile(nodes + u"/Impact/.git/config"_s,
                          "[core]\n\tbare = false\n"
                          "[remote \"upstream\"]\n\turl = https://example.test/fork.git\n"
                          "[remote \"origin\"]\n\turl = https://github.com/ltdrdata/ComfyUI-Impact-Pack.git\n"
                          "\tfetch = +refs/heads/*:refs/remotes/origin/*\n"));
    ASSERT_TRUE(writeFile(nodes + u"/Impact/.git/HEAD"_s, "ref: refs/heads/main\n"));
    ASSERT_TRUE(writeFile(nodes + u"/Impact/.git/refs/heads/main"_s, "0123456789abcdef0123456789abcdef01234567\n"));

    ASSERT_TRUE(writeFile(nodes + u"/Packed/.git/config"_s, "[remote \"origin\"]\n\turl = https://example.test/packed\n"));
    ASSERT_TRUE(writeFile(nodes + u"/Packed/.git/HEAD"_s, "ref: refs/heads/master\n"));
    ASSERT_TRUE(writeFile(nodes + u"/Packed/.git/packed-refs"_s,
                          "# pack-refs with: peeled fully-peeled sorted\n"
                          "fedcba9876543210fedcba9876543210fedcba98 refs/heads/master\n"));

    ASSERT_TRUE(writeFile(nodes + u"/plain/__init__.py"_s, "NODE_CLASS_MAPPINGS = {}\n"));
    ASSERT_TRUE(QDir().mkpath(nodes + u"/__pycache__"_s));
    ASSERT_TRUE(QDir().mkpath(nodes + u"/.disabled"_s));
    ASSERT_TRUE(writeFile(nodes + u"/single.py"_s, "# loose file\n"));

    const QVector<InstalledPackageExtension> found = GitExtensionManager::scanInstalledExtensions(nodes);

    ASSERT_EQ(found.size(), 3);
    EXPECT_EQ(found[0].title(), u"Impact"_s);
    EXPECT_EQ(found[0].gitRepositoryUrl, std::optional<QString>(u"https://github.com/ltdrdata/ComfyUI-Impact-Pack.git"_s));
    EXPECT_EQ(found[0].version, std::optional<QString>(u"0123456789abcdef0123456789abcdef01234567"_s));

    EXPECT_EQ(found[1].title(), u"Packed"_s);
    EXPECT_EQ(found[1].version, std::optional<QString>(u"fedcba9876543210fedcba9876543210fedcba98"_s));

    EXPECT_EQ(found[2].title(), u"plain"_s);
    EXPECT_FALSE(found[2].gitRepositoryUrl.has_value());
    EXPECT_FALSE(found[2].version.has_value());
}

TEST(GitExtensionManagerTests, FetchInstalledRunsScanInBackground)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;
    ASSERT_TRUE(QDir().mkpath(dir.filePath(u"custom_nodes/one"_s)));

    GitExtensionManager manager({});
    QEventLoop loop;
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);

    bool called = false;
    QVector<InstalledPackageExtension> received;
    manager.fetchInstalledExtensions(packageAt(dir.path()),
                                     [&](const QVector<InstalledPackageExtension>& extensions, const Utils::Result& r) {
        called = r.ok;
        received = extensions;
        loop.quit();
    });
    loop.exec();

    ASSERT_TRUE(called);
    ASSERT_EQ(received.size(), 1);
    EXPECT_EQ(received[0].title(), u"one"_s);
}

TEST(GitExtensionManagerTests, OnlyGitCloneInstallsAreSupported)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;

    PackageExtension copy;
    copy.title = u"Single file"_s;
    copy.files = {u"https://example.test/node.py"_s};
    copy.installType = Packages::InstallType::Copy;

    GitExtensionManager manager({});
    Utils::Result result;
    manager.installExtension(packageAt(dir.path()), copy, {}, {}, [&](const Utils::Result& r) { result = r; });

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.isUnsupported());
}

TEST(GitExtensionManagerTests, InstallRefusesExistingTarget)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;
    ASSERT_TRUE(QDir().mkpath(dir.filePath(u"custom_nodes/ComfyUI-Impact-Pack"_s)));

    PackageExtension ext;
    ext.title = u"Impact Pack"_s;
    ext.files = {u"https://github.com/ltdrdata/ComfyUI-Impact-Pack.git"_s};
    ext.installType = Packages::InstallType::GitClone;

    EXPECT_EQ(GitExtensionManager::cloneTargetFor(packageAt(dir.path()), ext),
              dir.filePath(u"custom_nodes/ComfyUI-Impact-Pack"_s));

    GitExtensionManager manager({});
    Utils::Result result;
    manager.installExtension(packageAt(dir.path()), ext, {}, {}, [&](const Utils::Result& r) { result = r; });

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.isUnsupported());
}

TEST(GitExtensionManagerTests, UninstallRemovesPathsInsideExtensionDirectory)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;
    const QString target = dir.filePath(u"custom_nodes/victim"_s);
    ASSERT_TRUE(writeFile(target + u"/nodes.py"_s, "pass\n"));

    InstalledPackageExtension ext;
    ext.paths = {target};

    GitExtensionManager manager({});
    int reports = 0;
    Utils::Result result;
    manager.uninstallExtension(packageAt(dir.path()), ext, {},
                               [&](const Packages::ProgressReport&) { ++reports; },
                               [&](const Utils::Result& r) { result = r; });

    EXPECT_TRUE(result.ok) << result.message().toStdString();
    EXPECT_FALSE(QFileInfo::exists(target));
    EXPECT_GE(reports, 1);
}

TEST(GitExtensionManagerTests, UninstallRefusesPathsOutsideExtensionDirectory)
{
    auto app = ensureCoreApp();
    QTemporaryDir dir;
    const QString outside = dir.filePath(u"models/keep"_s);
    ASSERT_TRUE(QDir().mkpath(outside));
    ASSERT_TRUE(QDir().mkpath(dir.filePath(u"custom_nodes"_s)));

    InstalledPackageExtension ext;
    ext.paths = {outside};

    GitExtensionManager manager({});
    Utils::Result result;
    manager.uninstallExtension(packageAt(dir.path()), ext, {}, {}, [&](const Utils::Result& r) { result = r; });

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(QFileInfo::exists(outside));
}
