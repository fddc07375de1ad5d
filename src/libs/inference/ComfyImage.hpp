// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "inference/InferenceGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUrl>

namespace Inference {

// Output image reference as reported by the backend's history endpoint.
struct INFERENCE_EXPORT ComfyImage final {
    QString filename;
    QString subfolder;
    QString type;

    bool operator==(const ComfyImage&) const = default;

    QString toFilePath(const QString& outputDir) const;
    QUrl toUrl(const QUrl& baseUrl) const;
};

// Either a file on this machine or a remote URL the backend serves.
class INFERENCE_EXPORT ImageSource final
{
public:
    ImageSource() = default;

    static ImageSource fromLocalFile(const QString& path);
    static ImageSource fromUrl(const QUrl& url);

    bool isValid() const noexcept { return !m_localPath.isEmpty() || m_url.isValid(); }
    bool isLocal() const noexcept { return !m_localPath.isEmpty(); }

    const QString& localPath() const noexcept { return m_localPath; }
    QUrl url() const;

    // Last path segment, e.g. "Kiln-Inference_00001_.png".
    QString fileName() const;

    bool operator==(const ImageSource&) const = default;

private:
    QString m_localPath;
    QUrl m_url;
};

} // namespace Inference

Q_DECLARE_METATYPE(Inference::ImageSource)
