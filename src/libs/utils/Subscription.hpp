// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QMetaObject>
#include <QtCore/QObject>

#include <functional>
#include <utility>

namespace Utils {

// Owns one "undo" action: a disconnect, an observer removal, a cancellation callback.
// Movable so it can live in members and containers; the action runs exactly once.
class Subscription final
{
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> release)
        : m_release(std::move(release))
    {}

    Subscription(Subscription&& other) noexcept
        : m_release(std::exchange(other.m_release, {}))
    {}

    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other) {
            reset();
            m_release = std::exchange(other.m_release, {});
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { reset(); }

    static Subscription fromConnection(QMetaObject::Connection connection)
    {
        return Subscription([connection]() { QObject::disconnect(connection); });
    }

    bool isActive() const noexcept { return bool(m_release); }

    void reset()
    {
        if (std::function<void()> release = std::exchange(m_release, {}))
            release();
    }

    // Forget the action without running it.
    void release() noexcept { m_release = {}; }

private:
    std::function<void()> m_release;
};

} // namespace Utils
