// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inference/ComfyImage.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QUrlQuery>

namespace Inference {

QString ComfyImage::toFilePath(const QString& outputDir) const
{
    QDir dir(outputDir);
    if (!subfolder.isEmpty())
        dir.setPath(dir.filePath(subfolder));
    return QDir::cleanPath(dir.filePath(filename));
}

QUrl ComfyImage::toUrl(const QUrl& baseUrl) const
{
    QUrl url = baseUrl;
    QString path = url.path();
    if (!path.endsWith(QLatin1Char('/')))
        path += QLatin1Char('/');
    url.setPath(path + QStringLiteral("view"));

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("filename"), filename);
    query.addQueryItem(QStringLiteral("subfolder"), subfolder);
    query.addQueryItem(QStringLiteral("type"), type);
    url.setQuery(query);
    return url;
}

ImageSource ImageSource::fromLocalFile(const QString& path)
{
    ImageSource s;
    s.m_localPath = path;
    return s;
}

ImageSource ImageSource::fromUrl(const QUrl& url)
{
    ImageSource s;
    s.m_url = url;
    return s;
}

QUrl ImageSource::url() const
{
    return isLocal() ? QUrl::fromLocalFile(m_localPath) : m_url;
}

QString ImageSource::fileName() const
{
    if (isLocal())
        return QFileInfo(m_localPath).fileName();

    // /view?filename=... carries the name in the query rather than the path.
    const QUrlQuery query(m_url);
    if (query.hasQueryItem(QStringLiteral("filename")))
        return query.queryItemValue(QStringLiteral("filename"), QUrl::FullyDecoded);
    return m_url.fileName();
}

} // namespace Inference
