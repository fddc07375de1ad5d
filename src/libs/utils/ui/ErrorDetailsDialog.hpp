// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtWidgets/QDialog>

class QPlainTextEdit;
class QPushButton;

namespace Utils {

// Modal report of a failed backend request. The response body sits behind a
// "Show response" toggle; JSON bodies are re-indented for reading.
class UTILS_EXPORT ErrorDetailsDialog final : public QDialog
{
    Q_OBJECT

public:
    ErrorDetailsDialog(const QString& title,
                       const QString& message,
                       const QByteArray& responseBody,
                       QWidget* parent = nullptr);

    const QString& responseText() const { return m_responseText; }
    bool isResponseVisible() const;
    void setResponseVisible(bool visible);

    // Indented JSON when `body` parses as JSON, otherwise the body as UTF-8 text.
    static QString formatResponseBody(const QByteArray& body);

private:
    QString m_responseText;
    QPushButton* m_toggle = nullptr;
    QPlainTextEdit* m_response = nullptr;
};

} // namespace Utils
