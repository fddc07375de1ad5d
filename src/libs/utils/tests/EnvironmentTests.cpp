// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/Environment.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>

using namespace Qt::StringLiterals;
using Utils::DocumentLoadResult;
using Utils::Environment;
using Utils::EnvironmentConfig;

namespace {

EnvironmentConfig configIn(const QTemporaryDir& dir, qint64 maxBytes = 4 * 1024 * 1024)
{
    EnvironmentConfig cfg;
    cfg.organizationName = u"Kiln"_s;
    cfg.applicationName = u"Kiln"_s;
    cfg.configRootOverride = dir.path();
    cfg.maxStateDocumentBytes = maxBytes;
    return cfg;
}

void overwrite(const QString& path, const QByteArray& bytes)
{
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    ASSERT_EQ(file.write(bytes), bytes.size());
}

} // namespace

TEST(EnvironmentTests, PathsLiveUnderConfigRoot)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    EXPECT_EQ(env.configDir(), QDir(dir.path()).filePath(u"Kiln"_s));
    EXPECT_EQ(env.settingsFilePath(), env.configDir() + u"/settings.ini"_s);
    EXPECT_EQ(env.stateFilePath(u"doc"), env.configDir() + u"/state/doc.json"_s);
    EXPECT_EQ(env.stateFilePath(u"doc", true), env.configDir() + u"/state/doc.json.bak"_s);
}

TEST(EnvironmentTests, SettingsRoundTripAndRemove)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Environment env(configIn(dir));

    EXPECT_FALSE(env.contains(u"inference/baseUrl"));
    env.setValue(u"inference/baseUrl", u"http://host:8188"_s);
    EXPECT_TRUE(env.contains(u"inference/baseUrl"));
    EXPECT_EQ(env.stringValue(u"inference/baseUrl"), u"http://host:8188"_s);
    EXPECT_TRUE(QFile::exists(env.settingsFilePath()));

    env.remove(u"inference/baseUrl");
    EXPECT_FALSE(env.contains(u"inference/baseUrl"));
    EXPECT_EQ(env.stringValue(u"inference/baseUrl", u"fallback"_s), u"fallback"_s);
}

TEST(EnvironmentTests, SettingsAreSharedBetweenInstances)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Environment writer(configIn(dir));
    writer.setValue(u"inference/connectOnStart", true);

    const Environment reader(configIn(dir));
    EXPECT_TRUE(reader.value(u"inference/connectOnStart", false).toBool());
}

TEST(EnvironmentTests, StringListValueDefaultsWhenMissing)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Environment env(configIn(dir));

    const QStringList def{u"a.json"_s};
    EXPECT_EQ(env.stringListValue(u"packages/manifests", def), def);

    env.setValue(u"packages/manifests", QStringList{u"x"_s, u"y"_s});
    EXPECT_EQ(env.stringListValue(u"packages/manifests"), (QStringList{u"x"_s, u"y"_s}));
}

TEST(EnvironmentTests, SaveLoadStateRoundTrip)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    QJsonObject o;
    o["steps"_L1] = 30;
    o["sampler"_L1] = u"euler"_s;

    const Utils::Result saved = env.saveState(u"inference-text-to-image", o);
    EXPECT_TRUE(saved.ok) << saved.message().toStdString();
    EXPECT_TRUE(QFile::exists(env.stateFilePath(u"inference-text-to-image")));

    const DocumentLoadResult load = env.loadState(u"inference-text-to-image");
    EXPECT_EQ(load.status, DocumentLoadResult::Status::Ok);
    EXPECT_FALSE(load.fromBackup);
    EXPECT_EQ(load.object.value("steps"_L1).toInt(), 30);
    EXPECT_EQ(load.object.value("sampler"_L1).toString(), u"euler"_s);
}

TEST(EnvironmentTests, LoadMissingStateIsNotFound)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    const DocumentLoadResult load = env.loadState(u"missing");
    EXPECT_EQ(load.status, DocumentLoadResult::Status::NotFound);
    EXPECT_TRUE(load.object.isEmpty());
}

TEST(EnvironmentTests, SaveRejectsOversizedDocument)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir, 32));

    QJsonObject o;
    o["big"_L1] = QString(200, u'x');

    const Utils::Result saved = env.saveState(u"too_big", o);
    EXPECT_FALSE(saved.ok);
    EXPECT_FALSE(saved.message().isEmpty());
    EXPECT_FALSE(QFile::exists(env.stateFilePath(u"too_big")));
}

TEST(EnvironmentTests, StateNamesCannotEscapeStateDirectory)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    EXPECT_TRUE(Environment::isValidStateName(u"inference-text-to-image"));
    EXPECT_FALSE(Environment::isValidStateName(u""));
    EXPECT_FALSE(Environment::isValidStateName(u"../settings"));
    EXPECT_FALSE(Environment::isValidStateName(u"nested/doc"));

    EXPECT_FALSE(env.saveState(u"../escape", QJsonObject{{"a"_L1, 1}}).ok);
    EXPECT_EQ(env.loadState(u"../escape").status, DocumentLoadResult::Status::Corrupt);
}

TEST(EnvironmentTests, SecondSaveKeepsPreviousAsBackup)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    ASSERT_TRUE(env.saveState(u"doc", QJsonObject{{"a"_L1, true}}).ok);
    EXPECT_FALSE(QFile::exists(env.stateFilePath(u"doc", true)));

    ASSERT_TRUE(env.saveState(u"doc", QJsonObject{{"a"_L1, false}}).ok);
    EXPECT_TRUE(QFile::exists(env.stateFilePath(u"doc", true)));

    const DocumentLoadResult load = env.loadState(u"doc");
    ASSERT_EQ(load.status, DocumentLoadResult::Status::Ok);
    EXPECT_FALSE(load.object.value("a"_L1).toBool());
}

TEST(EnvironmentTests, CorruptPrimaryFallsBackToBackup)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    ASSERT_TRUE(env.saveState(u"doc", QJsonObject{{"v"_L1, 1}}).ok);
    ASSERT_TRUE(env.saveState(u"doc", QJsonObject{{"v"_L1, 2}}).ok);
    overwrite(env.stateFilePath(u"doc"), "{not valid json");

    const DocumentLoadResult load = env.loadState(u"doc");
    EXPECT_EQ(load.status, DocumentLoadResult::Status::Ok);
    EXPECT_TRUE(load.fromBackup);
    EXPECT_EQ(load.object.value("v"_L1).toInt(), 1);
}

TEST(EnvironmentTests, CorruptPrimaryWithoutBackupIsCorrupt)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const Environment env(configIn(dir));

    ASSERT_TRUE(env.saveState(u"doc", QJsonObject{{"v"_L1, 1}}).ok);
    overwrite(env.stateFilePath(u"doc"), "[1, 2");

    const DocumentLoadResult load = env.loadState(u"doc");
    EXPECT_EQ(load.status, DocumentLoadResult::Status::Corrupt);
    EXPECT_FALSE(load.error.isEmpty());
}
