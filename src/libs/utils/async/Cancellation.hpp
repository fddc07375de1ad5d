// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Subscription.hpp"
#include "utils/reactive/ObserverList.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace Utils::Async {

// Cooperative cancellation. A CancellationSource hands out tokens; tokens are observed at the
// points where a flow resumes, and callbacks registered on a token run once, synchronously, on the
// thread that calls cancel(). All of this is GUI-thread only.
class CancellationToken;

class CancellationSource final {
public:
    CancellationSource()
        : m_state(std::make_shared<State>())
    {}

    CancellationToken token() const;

    void cancel()
    {
        if (m_state->cancelled)
            return;
        m_state->cancelled = true;
        m_state->callbacks.notify();
    }

    bool isCancellationRequested() const noexcept { return m_state->cancelled; }

private:
    friend class CancellationToken;

    struct State {
        bool cancelled = false;
        Reactive::ObserverList<> callbacks;
    };

    std::shared_ptr<State> m_state;
};

class CancellationToken final {
public:
    // A default token can never be cancelled.
    CancellationToken() = default;

    static CancellationToken none() { return {}; }

    bool canBeCancelled() const noexcept { return static_cast<bool>(m_state); }
    bool isCancellationRequested() const noexcept { return m_state && m_state->cancelled; }

    // Runs immediately when the token is already cancelled.
    Subscription onCancelled(std::function<void()> callback) const
    {
        if (!m_state || !callback)
            return {};
        if (m_state->cancelled) {
            callback();
            return {};
        }
        return m_state->callbacks.add(std::move(callback));
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
        : m_state(std::move(state))
    {}

    std::shared_ptr<CancellationSource::State> m_state;
};

inline CancellationToken CancellationSource::token() const
{
    return CancellationToken(m_state);
}

} // namespace Utils::Async
