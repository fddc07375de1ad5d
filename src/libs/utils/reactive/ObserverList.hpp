// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Subscription.hpp"

#include <QtCore/QtGlobal>

#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace Utils::Reactive {

// Callback registry for the non-QObject reactive types (templates cannot carry Q_OBJECT).
// Subscriptions hold a weak reference, so they may outlive the list.
template <typename... Args>
class ObserverList final {
public:
    using Callback = std::function<void(Args...)>;

    ObserverList()
        : m_state(std::make_shared<State>())
    {}

    ObserverList(const ObserverList&) = delete;
    ObserverList& operator=(const ObserverList&) = delete;

    Subscription add(Callback callback)
    {
        if (!callback)
            return {};

        const quint64 id = m_state->nextId++;
        m_state->callbacks.emplace(id, std::move(callback));

        std::weak_ptr<State> weak = m_state;
        return Subscription([weak, id]() {
            if (auto state = weak.lock())
                state->callbacks.erase(id);
        });
    }

    // Observers added or removed while notifying take effect on the next notification.
    void notify(Args... args) const
    {
        std::vector<std::pair<quint64, Callback>> snapshot(m_state->callbacks.begin(), m_state->callbacks.end());
        for (const auto& [id, callback] : snapshot) {
            if (m_state->callbacks.count(id) != 0)
                callback(args...);
        }
    }

    bool isEmpty() const noexcept { return m_state->callbacks.empty(); }
    int size() const noexcept { return static_cast<int>(m_state->callbacks.size()); }

private:
    struct State {
        std::map<quint64, Callback> callbacks;
        quint64 nextId = 1;
    };

    std::shared_ptr<State> m_state;
};

} // namespace Utils::Reactive
