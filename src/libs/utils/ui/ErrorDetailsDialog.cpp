// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/ui/ErrorDetailsDialog.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QSignalBlocker>
#include <QtGui/QClipboard>
#include <QtGui/QFontDatabase>
#include <QtGui/QGuiApplication>
#include <QtWidgets/QDialogButtonBox>
#include <QtWidgets/QLabel>
#include <QtWidgets/QPlainTextEdit>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QVBoxLayout>

using namespace Qt::StringLiterals;

namespace Utils {

ErrorDetailsDialog::ErrorDetailsDialog(const QString& title,
                                       const QString& message,
                                       const QByteArray& responseBody,
                                       QWidget* parent)
    : QDialog(parent)
    , m_responseText(formatResponseBody(responseBody))
{
    setObjectName(u"ErrorDetailsDialog"_s);
    setWindowTitle(title);
    setModal(true);
    setMinimumWidth(480);

    auto* layout = new QVBoxLayout(this);

    auto* messageLabel = new QLabel(message, this);
    messageLabel->setWordWrap(true);
    messageLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(messageLabel);

    m_response = new QPlainTextEdit(m_responseText, this);
    m_response->setReadOnly(true);
    m_response->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    m_response->setVisible(false);
    layout->addWidget(m_response, 1);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Close, this);
    m_toggle = buttons->addButton(tr("Show response"), QDialogButtonBox::ActionRole);
    m_toggle->setCheckable(true);
    m_toggle->setEnabled(!m_responseText.isEmpty());
    QPushButton* copy = buttons->addButton(tr("Copy"), QDialogButtonBox::ActionRole);
    layout->addWidget(buttons);

    connect(m_toggle, &QPushButton::toggled, this, &ErrorDetailsDialog::setResponseVisible);
    connect(copy, &QPushButton::clicked, this, [this, message]() {
        QString text = message;
        if (!m_responseText.isEmpty())
            text += u"\n\n"_s + m_responseText;
        QGuiApplication::clipboard()->setText(text);
    });
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
}

bool ErrorDetailsDialog::isResponseVisible() const
{
    return m_response->isVisibleTo(this);
}

void ErrorDetailsDialog::setResponseVisible(bool visible)
{
    visible = visible && !m_responseText.isEmpty();
    m_response->setVisible(visible);
    m_toggle->setText(visible ? tr("Hide response") : tr("Show response"));
    if (m_toggle->isChecked() != visible) {
        const QSignalBlocker blocker(m_toggle);
        m_toggle->setChecked(visible);
    }
    adjustSize();
}

QString ErrorDetailsDialog::formatResponseBody(const QByteArray& body)
{
    const QByteArray trimmed = body.trimmed();
    if (trimmed.isEmpty())
        return {};

    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error == QJsonParseError::NoError && !doc.isNull())
        return QString::fromUtf8(doc.toJson(QJsonDocument::Indented)).trimmed();
    return QString::fromUtf8(trimmed);
}

} // namespace Utils
