// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/ChangeSet.hpp"
#include "utils/reactive/ObserverList.hpp"

#include <QtCore/QHash>
#include <QtCore/QSet>
#include <QtCore/QVector>

#include <functional>
#include <optional>
#include <utility>

namespace Utils::Reactive {

// Keyed, insertion-ordered store that publishes every edit as a ChangeSet.
// Keys are derived from values by the selector given at construction and never stored separately
// from the value they were derived from.
template <typename T, typename K>
class SourceCache final {
public:
    using KeySelector = std::function<K(const T&)>;
    using Equality = std::function<bool(const T&, const T&)>;
    using ChangeSetType = ChangeSet<T, K>;
    using Observer = std::function<void(const ChangeSetType&)>;

    explicit SourceCache(KeySelector keySelector)
        : m_keyOf(std::move(keySelector))
    {}

    SourceCache(const SourceCache&) = delete;
    SourceCache& operator=(const SourceCache&) = delete;

    K keyOf(const T& item) const { return m_keyOf(item); }

    int count() const noexcept { return m_order.size(); }
    bool isEmpty() const noexcept { return m_order.isEmpty(); }
    bool contains(const K& key) const { return m_items.contains(key); }

    QVector<K> keys() const { return m_order; }

    QVector<T> items() const
    {
        QVector<T> out;
        out.reserve(m_order.size());
        for (const K& key : m_order)
            out.push_back(m_items.value(key));
        return out;
    }

    std::optional<T> lookup(const K& key) const
    {
        const auto it = m_items.constFind(key);
        if (it == m_items.cend())
            return std::nullopt;
        return it.value();
    }

    void addOrUpdate(const T& item) { addOrUpdate(QVector<T>{item}); }

    void addOrUpdate(const QVector<T>& items)
    {
        ChangeSetType changes;
        for (const T& item : items)
            upsert(item, changes, Equality{});
        publish(changes);
    }

    void remove(const K& key) { remove(QVector<K>{key}); }

    void remove(const QVector<K>& keys)
    {
        ChangeSetType changes;
        for (const K& key : keys)
            erase(key, changes);
        publish(changes);
    }

    void clear()
    {
        ChangeSetType changes;
        for (int i = m_order.size() - 1; i >= 0; --i)
            changes.addRemoved(m_order[i], m_items.value(m_order[i]), i);
        m_order.clear();
        m_items.clear();
        publish(changes);
    }

    // Make the cache hold exactly `items`. Keys missing from `items` are removed, new keys are
    // added, and existing keys are updated only when `equal` reports a difference. A single
    // change set describes the whole edit. When `items` repeats a key the last occurrence wins.
    void editDiff(const QVector<T>& items, Equality equal = {})
    {
        QHash<K, int> lastIndex;
        for (int i = 0; i < items.size(); ++i)
            lastIndex.insert(m_keyOf(items[i]), i);

        ChangeSetType changes;

        const QVector<K> existing = m_order;
        for (const K& key : existing) {
            if (!lastIndex.contains(key))
                erase(key, changes);
        }

        for (int i = 0; i < items.size(); ++i) {
            if (lastIndex.value(m_keyOf(items[i])) != i)
                continue;
            upsert(items[i], changes, equal);
        }

        publish(changes);
    }

    // The observer first receives the current contents as additions, then every later edit.
    Subscription connect(Observer observer)
    {
        if (!observer)
            return {};

        ChangeSetType initial;
        for (int i = 0; i < m_order.size(); ++i)
            initial.addAdded(m_order[i], m_items.value(m_order[i]), i);
        if (!initial.empty())
            observer(initial);

        return m_observers.add(std::move(observer));
    }

    int observerCount() const noexcept { return m_observers.size(); }

private:
    void upsert(const T& item, ChangeSetType& changes, const Equality& equal)
    {
        const K key = m_keyOf(item);
        auto it = m_items.find(key);
        if (it == m_items.end()) {
            m_items.insert(key, item);
            m_order.push_back(key);
            changes.addAdded(key, item, m_order.size() - 1);
            return;
        }

        const bool same = equal ? equal(it.value(), item) : (it.value() == item);
        if (same)
            return;

        T previous = std::exchange(it.value(), item);
        changes.addUpdated(key, item, std::move(previous), m_order.indexOf(key));
    }

    void erase(const K& key, ChangeSetType& changes)
    {
        const auto it = m_items.find(key);
        if (it == m_items.end())
            return;

        const int index = m_order.indexOf(key);
        changes.addRemoved(key, it.value(), index);
        m_items.erase(it);
        if (index >= 0)
            m_order.remove(index);
    }

    void publish(const ChangeSetType& changes)
    {
        if (changes.empty())
            return;
        m_observers.notify(changes);
    }

    KeySelector m_keyOf;
    QVector<K> m_order;
    QHash<K, T> m_items;
    ObserverList<const ChangeSetType&> m_observers;
};

} // namespace Utils::Reactive
