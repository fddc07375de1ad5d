// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QVector>

#include <optional>
#include <utility>

namespace Utils {

template <typename T, typename K>
struct Change final {
    enum class Kind {
        Added,
        Removed,
        Updated
    };

    Kind kind = Kind::Updated;
    K key{};
    T current{};

    // Set for Updated (value before the edit); unset otherwise.
    std::optional<T> previous;

    // Position in the cache's iteration order at the time of the change.
    int index = -1;
};

template <typename T, typename K>
class ChangeSet final {
public:
    using ChangeType = Change<T, K>;
    using Kind = typename ChangeType::Kind;

    const QVector<ChangeType>& changes() const noexcept { return m_changes; }
    bool empty() const noexcept { return m_changes.isEmpty(); }
    int size() const noexcept { return m_changes.size(); }

    void clear() { m_changes.clear(); }

    void addAdded(K key, T current, int index)
    {
        ChangeType c;
        c.kind = Kind::Added;
        c.key = std::move(key);
        c.current = std::move(current);
        c.index = index;
        m_changes.push_back(std::move(c));
    }

    void addRemoved(K key, T current, int index)
    {
        ChangeType c;
        c.kind = Kind::Removed;
        c.key = std::move(key);
        c.current = std::move(current);
        c.index = index;
        m_changes.push_back(std::move(c));
    }

    void addUpdated(K key, T current, T previous, int index)
    {
        ChangeType c;
        c.kind = Kind::Updated;
        c.key = std::move(key);
        c.current = std::move(current);
        c.previous = std::move(previous);
        c.index = index;
        m_changes.push_back(std::move(c));
    }

    int count(Kind kind) const
    {
        int n = 0;
        for (const ChangeType& c : m_changes) {
            if (c.kind == kind)
                ++n;
        }
        return n;
    }

private:
    QVector<ChangeType> m_changes;
};

} // namespace Utils
