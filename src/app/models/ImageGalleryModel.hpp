// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <inference/ComfyImage.hpp>

#include <QtCore/QAbstractListModel>
#include <QtCore/QHash>
#include <QtCore/QSize>
#include <QtCore/QVector>
#include <QtGui/QImage>

namespace Kiln::Models {

class APP_EXPORT ImageGalleryModel final : public QAbstractListModel
{
    Q_OBJECT
    Q_PROPERTY(int count READ count NOTIFY countChanged)

public:
    enum Role {
        SourceRole = Qt::UserRole + 1,
        LocalPathRole,
        UrlRole,
        IsLocalRole
    };

    explicit ImageGalleryModel(QObject* parent = nullptr);

    const QVector<Inference::ImageSource>& images() const noexcept { return m_images; }
    int count() const noexcept { return int(m_images.size()); }

    void setImages(const QVector<Inference::ImageSource>& images);
    void clear();

    QSize thumbnailSize() const noexcept { return m_thumbnailSize; }
    void setThumbnailSize(const QSize& size);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

signals:
    void countChanged(int count);

private:
    QImage thumbnailFor(const Inference::ImageSource& source) const;

    QVector<Inference::ImageSource> m_images;
    QSize m_thumbnailSize{128, 128};
    mutable QHash<QString, QImage> m_thumbnails;
};

} // namespace Kiln::Models
