// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/reactive/ObserverList.hpp"
#include "utils/reactive/SelectableItem.hpp"
#include "utils/reactive/SourceCache.hpp"

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <functional>
#include <memory>
#include <utility>

namespace Utils::Reactive {

// Projection of a SourceCache into selectable wrappers, with a derived "selected" view and a
// query-filtered view. Wrappers are kept per key: an update swaps the wrapped value but keeps the
// wrapper, so selection survives edits of the underlying item.
template <typename T, typename K>
class SelectableCollection final {
public:
    using Item = SelectableItem<T>;
    using ItemPtr = std::shared_ptr<Item>;
    using Predicate = std::function<bool(const T&)>;
    using PredicateFactory = std::function<Predicate(const QString& query)>;
    using Listener = std::function<void()>;

    SelectableCollection(SourceCache<T, K>& source, PredicateFactory predicateFactory)
        : m_predicateFactory(std::move(predicateFactory))
    {
        m_sourceSubscription = source.connect([this](const typename SourceCache<T, K>::ChangeSetType& changes) {
            apply(changes);
        });
    }

    SelectableCollection(const SelectableCollection&) = delete;
    SelectableCollection& operator=(const SelectableCollection&) = delete;

    ~SelectableCollection()
    {
        m_sourceSubscription.reset();
        for (const ItemPtr& item : std::as_const(m_items))
            item->setSelectionHook({});
    }

    const QVector<ItemPtr>& items() const noexcept { return m_items; }
    const QVector<ItemPtr>& selectedItems() const noexcept { return m_selected; }
    const QVector<ItemPtr>& filteredItems() const noexcept { return m_filtered; }

    ItemPtr find(const K& key) const { return m_byKey.value(key); }

    QVector<T> selectedValues() const
    {
        QVector<T> out;
        out.reserve(m_selected.size());
        for (const ItemPtr& item : m_selected)
            out.push_back(item->item());
        return out;
    }

    QString query() const { return m_query; }

    void setQuery(const QString& query)
    {
        if (query == m_query)
            return;
        m_query = query;
        m_predicate = (m_query.trimmed().isEmpty() || !m_predicateFactory) ? Predicate{}
                                                                          : m_predicateFactory(m_query);
        rebuildFiltered();
        m_filterListeners.notify();
    }

    void clearSelection()
    {
        const QVector<ItemPtr> snapshot = m_selected;
        for (const ItemPtr& item : snapshot)
            item->setSelected(false);
    }

    Subscription onItemsChanged(Listener listener) { return m_itemListeners.add(std::move(listener)); }
    Subscription onSelectionChanged(Listener listener) { return m_selectionListeners.add(std::move(listener)); }
    Subscription onFilterChanged(Listener listener) { return m_filterListeners.add(std::move(listener)); }

private:
    void apply(const typename SourceCache<T, K>::ChangeSetType& changes)
    {
        using Kind = typename SourceCache<T, K>::ChangeSetType::Kind;

        bool selectionTouched = false;
        for (const auto& change : changes.changes()) {
            switch (change.kind) {
            case Kind::Added: {
                auto item = std::make_shared<Item>(change.current);
                item->setSelectionHook([this](Item&) { onItemSelectionChanged(); });
                m_byKey.insert(change.key, item);
                m_items.push_back(std::move(item));
                break;
            }
            case Kind::Updated: {
                if (const ItemPtr item = m_byKey.value(change.key))
                    item->setItem(change.current);
                selectionTouched = true;
                break;
            }
            case Kind::Removed: {
                const ItemPtr item = m_byKey.take(change.key);
                if (!item)
                    break;
                item->setSelectionHook({});
                selectionTouched = selectionTouched || item->isSelected();
                m_items.removeOne(item);
                break;
            }
            }
        }

        rebuildFiltered();
        if (selectionTouched)
            rebuildSelected();

        m_itemListeners.notify();
        m_filterListeners.notify();
        if (selectionTouched)
            m_selectionListeners.notify();
    }

    void onItemSelectionChanged()
    {
        rebuildSelected();
        m_selectionListeners.notify();
    }

    void rebuildSelected()
    {
        m_selected.clear();
        for (const ItemPtr& item : std::as_const(m_items)) {
            if (item->isSelected())
                m_selected.push_back(item);
        }
    }

    void rebuildFiltered()
    {
        m_filtered.clear();
        for (const ItemPtr& item : std::as_const(m_items)) {
            if (!m_predicate || m_predicate(item->item()))
                m_filtered.push_back(item);
        }
    }

    PredicateFactory m_predicateFactory;
    Predicate m_predicate;
    QString m_query;

    QVector<ItemPtr> m_items;
    QHash<K, ItemPtr> m_byKey;
    QVector<ItemPtr> m_selected;
    QVector<ItemPtr> m_filtered;

    ObserverList<> m_itemListeners;
    ObserverList<> m_selectionListeners;
    ObserverList<> m_filterListeners;

    Subscription m_sourceSubscription;
};

} // namespace Utils::Reactive
