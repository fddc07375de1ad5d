// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>

namespace Utils::Async {

// Holds the latest text pushed in a burst and publishes it once input goes quiet.
class UTILS_EXPORT Debouncer final : public QObject
{
    Q_OBJECT

public:
    explicit Debouncer(int quietMs, QObject* parent = nullptr)
        : QObject(parent)
    {
        m_timer.setSingleShot(true);
        m_timer.setInterval(qMax(0, quietMs));
        connect(&m_timer, &QTimer::timeout, this, &Debouncer::publish);
    }

    int quietMs() const { return m_timer.interval(); }
    bool isPending() const { return m_timer.isActive(); }
    const QString& pendingValue() const { return m_pending; }

    void push(const QString& value)
    {
        m_pending = value;
        m_timer.start();
    }

    // Publishes a pending value immediately. No-op when nothing is waiting.
    void flush()
    {
        if (m_timer.isActive()) {
            m_timer.stop();
            publish();
        }
    }

    void cancel() { m_timer.stop(); }

signals:
    void settled(const QString& value);

private:
    void publish() { emit settled(m_pending); }

    QTimer m_timer;
    QString m_pending;
};

} // namespace Utils::Async
