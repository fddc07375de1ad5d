// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "packages/GitExtensionManager.hpp"

#include "packages/ExtensionSynchronizer.hpp"

#include <utils/async/AsyncTask.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QPointer>
#include <QtCore/QProcess>
#include <QtCore/QTextStream>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <memory>
#include <utility>

using namespace Qt::StringLiterals;

namespace Packages {

namespace {

QStringList readLines(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    QStringList lines;
    QTextStream in(&file);
    while (!in.atEnd())
        lines.push_back(in.readLine().trimmed());
    return lines;
}

std::optional<QString> readOriginUrl(const QDir& gitDir)
{
    bool inOrigin = false;
    for (const QString& line : readLines(gitDir.filePath(u"config"_s))) {
        if (line.startsWith(u'[')) {
            inOrigin = line == "[remote \"origin\"]"_L1;
            continue;
        }
        if (!inOrigin)
            continue;

        const qsizetype eq = line.indexOf(u'=');
        if (eq < 0 || line.left(eq).trimmed() != "url"_L1)
            continue;
        const QString url = line.mid(eq + 1).trimmed();
        if (!url.isEmpty())
            return url;
    }
    return std::nullopt;
}

std::optional<QString> readHeadCommit(const QDir& gitDir)
{
    const QStringList head = readLines(gitDir.filePath(u"HEAD"_s));
    if (head.isEmpty() || head.first().isEmpty())
        return std::nullopt;

    const QString first = head.first();
    if (!first.startsWith("ref:"_L1))
        return first; // detached

    const QString ref = first.mid(4).trimmed();
    const QStringList loose = readLines(gitDir.filePath(ref));
    if (!loose.isEmpty() && !loose.first().isEmpty())
        return loose.first();

    for (const QString& line : readLines(gitDir.filePath(u"packed-refs"_s))) {
        if (line.startsWith(u'#') || line.startsWith(u'^'))
            continue;
        const QStringList parts = line.split(u' ', Qt::SkipEmptyParts);
        if (parts.size() == 2 && parts.at(1) == ref)
            return parts.at(0);
    }
    return std::nullopt;
}

bool isInside(const QString& path, const QString& directory)
{
    const QString dir = QFileInfo(directory).canonicalFilePath();
    const QString target = QFileInfo(path).canonicalFilePath();
    if (dir.isEmpty() || target.isEmpty() || target == dir)
        return false;
    return target.startsWith(dir + u'/');
}

QString tail(const QByteArray& output, int maxLines = 5)
{
    QStringList lines = QString::fromUtf8(output).split(u'\n', Qt::SkipEmptyParts);
    if (lines.size() > maxLines)
        lines = lines.mid(lines.size() - maxLines);
    return lines.join(u'\n').trimmed();
}

struct ManifestFetch {
    QVector<QVector<PackageExtension>> perSource;
    QStringList errors;
    int remaining = 0;
    IExtensionManager::ManifestCallback done;
};

} // namespace

GitExtensionManager::GitExtensionManager(QStringList manifestLocations, QObject* parent)
    : IExtensionManager(parent)
    , m_manifestLocations(std::move(manifestLocations))
{}

QVector<QUrl> GitExtensionManager::manifests(const InstalledPackage& package) const
{
    QVector<QUrl> urls;
    for (const QString& location : m_manifestLocations) {
        const QString trimmed = location.trimmed();
        if (trimmed.isEmpty())
            continue;

        const QUrl url(trimmed);
        if (url.scheme() == "http"_L1 || url.scheme() == "https"_L1 || url.scheme() == "file"_L1) {
            urls.push_back(url);
            continue;
        }

        // Plain paths are relative to the package root.
        const QString path = QDir::isAbsolutePath(trimmed) ? trimmed : QDir(package.rootPath).filePath(trimmed);
        urls.push_back(QUrl::fromLocalFile(QDir::cleanPath(path)));
    }
    return urls;
}

QVector<PackageExtension> GitExtensionManager::parseManifest(const QJsonObject& manifest, QString* error)
{
    const QJsonValue nodes = manifest.value("custom_nodes"_L1);
    if (!nodes.isArray()) {
        if (error)
            *error = u"Manifest has no \"custom_nodes\" array."_s;
        return {};
    }

    QVector<PackageExtension> out;
    for (const QJsonValue& entry : nodes.toArray()) {
        if (auto ext = PackageExtension::fromManifestEntry(entry.toObject()))
            out.push_back(std::move(*ext));
    }
    return out;
}

void GitExtensionManager::fetchManifest(const QUrl& url, SourceCallback done)
{
    if (url.isLocalFile()) {
        QString error;
        const QJsonObject manifest = Utils::JsonFileUtils::readObject(url.toLocalFile(), &error);
        if (!error.isEmpty()) {
            done({}, error);
            return;
        }
        const QVector<PackageExtension> parsed = parseManifest(manifest, &error);
        done(parsed, error.isEmpty() ? QString() : url.toDisplayString() + u": "_s + error);
        return;
    }

    QNetworkRequest request(url);
    request.setTransferTimeout(kManifestTimeoutMs);
    QNetworkReply* reply = m_network.get(request);

    connect(reply, &QNetworkReply::finished, this, [reply, url, done = std::move(done)]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            done({}, u"%1: %2"_s.arg(url.toDisplayString(), reply->errorString()));
            return;
        }

        QString error;
        const QJsonObject manifest = Utils::JsonFileUtils::parseObject(reply->readAll(), url.toDisplayString(), &error);
        if (!error.isEmpty()) {
            done({}, error);
            return;
        }
        const QVector<PackageExtension> parsed = parseManifest(manifest, &error);
        done(parsed, error.isEmpty() ? QString() : url.toDisplayString() + u": "_s + error);
    });
}

void GitExtensionManager::fetchManifestExtensions(const QVector<QUrl>& manifests, ManifestCallback done)
{
    if (manifests.isEmpty()) {
        done({}, Utils::Result::success());
        return;
    }

    auto state = std::make_shared<ManifestFetch>();
    state->perSource.resize(manifests.size());
    state->remaining = manifests.size();
    state->done = std::move(done);

    for (int i = 0; i < manifests.size(); ++i) {
        fetchManifest(manifests.at(i), [state, i](const QVector<PackageExtension>& extensions, const QString& error) {
            if (!error.isEmpty()) {
                qCWarning(packageslog) << "Manifest fetch failed:" << error;
                state->errors.push_back(error);
            } else {
                state->perSource[i] = extensions;
            }

            if (--state->remaining > 0)
                return;

            QVector<PackageExtension> all;
            for (const auto& source : std::as_const(state->perSource))
                all += source;
            state->done(all, state->errors.isEmpty() ? Utils::Result::success()
                                                     : Utils::Result::failure(state->errors));
        });
    }
}

QVector<InstalledPackageExtension> GitExtensionManager::scanInstalledExtensions(const QString& extensionsPath)
{
    QVector<InstalledPackageExtension> out;

    QDir root(extensionsPath);
    if (!root.exists())
        return out;

    const QFileInfoList entries = root.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& entry : entries) {
        if (entry.fileName().startsWith(u'.') || entry.fileName() == "__pycache__"_L1)
            continue;

        InstalledPackageExtension ext;
        ext.paths.push_back(entry.absoluteFilePath());

        const QDir gitDir(QDir(entry.absoluteFilePath()).filePath(u".git"_s));
        if (gitDir.exists()) {
            ext.gitRepositoryUrl = readOriginUrl(gitDir);
            ext.version = readHeadCommit(gitDir);
        }
        out.push_back(std::move(ext));
    }
    return out;
}

void GitExtensionManager::fetchInstalledExtensions(const InstalledPackage& package, InstalledCallback done)
{
    const QString path = package.extensionsPath();

    Utils::Async::run(
        this,
        [path]() { return scanInstalledExtensions(path); },
        [done](QVector<InstalledPackageExtension> extensions) { done(extensions, Utils::Result::success()); },
        [done, path](const QString& message) {
            done({}, Utils::Result::failure(u"Could not scan %1: %2"_s.arg(path, message)));
        });
}

QString GitExtensionManager::cloneTargetFor(const InstalledPackage& package, const PackageExtension& extension)
{
    if (extension.files.isEmpty())
        return {};
    const QString name = ExtensionSynchronizer::stripGitSuffix(QUrl(extension.files.first()).fileName());
    if (name.isEmpty())
        return {};
    return QDir(package.extensionsPath()).filePath(name);
}

void GitExtensionManager::installExtension(const InstalledPackage& package,
                                           const PackageExtension& extension,
                                           const Utils::Async::CancellationToken& token,
                                           ProgressCallback progress,
                                           DoneCallback done)
{
    if (extension.installType != InstallType::GitClone) {
        done(Utils::Result::unsupported(u"Install type \"%1\" of %2 is not supported."_s
                                            .arg(installTypeToString(extension.installType), extension.title)));
        return;
    }

    const QString target = cloneTargetFor(package, extension);
    if (target.isEmpty()) {
        done(Utils::Result::failure(u"%1 has no repository to clone."_s.arg(extension.title)));
        return;
    }
    if (QFileInfo::exists(target)) {
        done(Utils::Result::failure(u"%1 already exists."_s.arg(QDir::toNativeSeparators(target))));
        return;
    }
    if (token.isCancellationRequested()) {
        done(Utils::Result::failure(u"Installation of %1 was cancelled."_s.arg(extension.title)));
        return;
    }
    if (!QDir().mkpath(package.extensionsPath())) {
        done(Utils::Result::failure(u"Could not create %1."_s.arg(package.extensionsPath())));
        return;
    }

    const QString title = u"Installing %1"_s.arg(extension.title);
    if (progress)
        progress(ProgressReport::indeterminate(title, extension.files.first()));

    auto* process = new QProcess(this);
    process->setProgram(m_gitProgram);
    process->setArguments({u"clone"_s, u"--progress"_s, extension.files.first(), target});

    auto stderrLog = std::make_shared<QByteArray>();
    auto cancelRegistration = std::make_shared<Utils::Subscription>();
    auto finish = std::make_shared<DoneCallback>(std::move(done));

    connect(process, &QProcess::readyReadStandardError, this, [process, stderrLog, progress, title]() {
        const QByteArray chunk = process->readAllStandardError();
        stderrLog->append(chunk);
        if (progress)
            progress(ProgressReport::indeterminate(title, tail(chunk, 1)));
    });

    connect(process, &QProcess::errorOccurred, this,
            [process, finish, cancelRegistration, this](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart || !*finish)
            return;
        cancelRegistration->reset();
        process->deleteLater();
        auto callback = std::exchange(*finish, {});
        callback(Utils::Result::failure(u"Could not start %1: %2"_s.arg(m_gitProgram, process->errorString())));
    });

    connect(process, &QProcess::finished, this,
            [process, finish, cancelRegistration, stderrLog, token, target, name = extension.title](
                int exitCode, QProcess::ExitStatus status) {
        cancelRegistration->reset();
        process->deleteLater();
        if (!*finish)
            return;
        auto callback = std::exchange(*finish, {});

        if (token.isCancellationRequested()) {
            QDir(target).removeRecursively();
            callback(Utils::Result::failure(u"Installation of %1 was cancelled."_s.arg(name)));
            return;
        }
        if (status != QProcess::NormalExit || exitCode != 0) {
            qCWarning(packageslog) << "git clone failed for" << name << "exit code" << exitCode;
            callback(Utils::Result::failure(u"git clone of %1 failed (exit code %2).\n%3"_s
                                                .arg(name)
                                                .arg(exitCode)
                                                .arg(tail(*stderrLog))));
            return;
        }
        qCInfo(packageslog) << "Installed" << name << "into" << target;
        callback(Utils::Result::success());
    });

    QPointer<QProcess> guard(process);
    *cancelRegistration = token.onCancelled([guard]() {
        if (guard && guard->state() != QProcess::NotRunning)
            guard->kill();
    });

    process->start();
}

void GitExtensionManager::uninstallExtension(const InstalledPackage& package,
                                             const InstalledPackageExtension& extension,
                                             const Utils::Async::CancellationToken& token,
                                             ProgressCallback progress,
                                             DoneCallback done)
{
    const QString title = u"Uninstalling %1"_s.arg(extension.title());

    if (token.isCancellationRequested()) {
        done(Utils::Result::failure(u"Removal of %1 was cancelled."_s.arg(extension.title())));
        return;
    }
    if (extension.paths.isEmpty()) {
        done(Utils::Result::failure(u"%1 has no files on disk."_s.arg(extension.title())));
        return;
    }

    Utils::Result result;
    for (int i = 0; i < extension.paths.size(); ++i) {
        const QString& path = extension.paths.at(i);
        if (progress)
            progress(ProgressReport{double(i) / extension.paths.size(), title, path});

        if (!isInside(path, package.extensionsPath())) {
            result.addError(u"Refusing to remove %1: outside of %2."_s.arg(path, package.extensionsPath()));
            continue;
        }

        const QFileInfo info(path);
        const bool removed = info.isDir() ? QDir(path).removeRecursively() : QFile::remove(path);
        if (!removed)
            result.addError(u"Could not remove %1."_s.arg(QDir::toNativeSeparators(path)));
    }

    if (progress)
        progress(ProgressReport{1.0, title, {}});

    if (result)
        qCInfo(packageslog) << "Uninstalled" << extension.title();
    done(result);
}

} // namespace Packages
