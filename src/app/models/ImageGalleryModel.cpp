// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/models/ImageGalleryModel.hpp"

#include <QtGui/QImageReader>

namespace Kiln::Models {

ImageGalleryModel::ImageGalleryModel(QObject* parent)
    : QAbstractListModel(parent)
{}

void ImageGalleryModel::setImages(const QVector<Inference::ImageSource>& images)
{
    const int before = count();
    beginResetModel();
    m_images = images;
    m_thumbnails.clear();
    endResetModel();
    if (before != count())
        emit countChanged(count());
}

void ImageGalleryModel::clear()
{
    if (m_images.isEmpty())
        return;
    setImages({});
}

void ImageGalleryModel::setThumbnailSize(const QSize& size)
{
    if (size == m_thumbnailSize || !size.isValid())
        return;
    m_thumbnailSize = size;
    m_thumbnails.clear();
    if (!m_images.isEmpty())
        emit dataChanged(index(0, 0), index(count() - 1, 0), {Qt::DecorationRole});
}

int ImageGalleryModel::rowCount(const QModelIndex& parent) const
{
    return parent.isValid() ? 0 : count();
}

QVariant ImageGalleryModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() >= count())
        return {};

    const Inference::ImageSource& source = m_images.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return source.fileName();
    case Qt::ToolTipRole:
        return source.isLocal() ? source.localPath() : source.url().toDisplayString();
    case Qt::DecorationRole:
        return source.isLocal() ? QVariant(thumbnailFor(source)) : QVariant();
    case SourceRole:
        return QVariant::fromValue(source);
    case LocalPathRole:
        return source.localPath();
    case UrlRole:
        return source.url();
    case IsLocalRole:
        return source.isLocal();
    default:
        return {};
    }
}

QHash<int, QByteArray> ImageGalleryModel::roleNames() const
{
    QHash<int, QByteArray> names = QAbstractListModel::roleNames();
    names.insert(SourceRole, "source");
    names.insert(LocalPathRole, "localPath");
    names.insert(UrlRole, "url");
    names.insert(IsLocalRole, "isLocal");
    return names;
}

QImage ImageGalleryModel::thumbnailFor(const Inference::ImageSource& source) const
{
    const auto it = m_thumbnails.constFind(source.localPath());
    if (it != m_thumbnails.cend())
        return it.value();

    QImageReader reader(source.localPath());
    reader.setAutoTransform(true);
    const QSize full = reader.size();
    if (full.isValid())
        reader.setScaledSize(full.scaled(m_thumbnailSize, Qt::KeepAspectRatio));

    QImage thumb = reader.read();
    if (thumb.isNull())
        qCDebug(applog) << "No thumbnail for" << source.localPath() << reader.errorString();
    m_thumbnails.insert(source.localPath(), thumb);
    return thumb;
}

} // namespace Kiln::Models
