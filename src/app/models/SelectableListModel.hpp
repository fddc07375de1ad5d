// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "app/AppGlobal.hpp"

#include <utils/reactive/SelectableCollection.hpp>

#include <QtCore/QAbstractListModel>

#include <functional>

namespace Kiln::Models {

// Checkable list over the filtered view of a SelectableCollection. The check state is the
// wrapper's selection flag; toggling it writes straight through to the collection.
class APP_EXPORT SelectableListModel final : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Role {
        KeyRole = Qt::UserRole + 1,
        SelectedRole,
        DetailRole
    };

    struct Source final {
        std::function<int()> count;
        std::function<QString(int row)> key;
        std::function<QString(int row)> title;
        std::function<QString(int row)> detail;
        std::function<bool(int row)> isSelected;
        std::function<void(int row, bool selected)> setSelected;
    };

    template <typename T, typename K>
    static Source sourceFor(Utils::Reactive::SelectableCollection<T, K>& collection,
                            std::function<QString(const T&)> title,
                            std::function<QString(const T&)> detail,
                            std::function<QString(const T&)> key)
    {
        auto at = [&collection](int row) { return collection.filteredItems().value(row); };
        Source source;
        source.count = [&collection]() { return int(collection.filteredItems().size()); };
        source.key = [at, key](int row) { const auto item = at(row); return item ? key(item->item()) : QString(); };
        source.title = [at, title](int row) { const auto item = at(row); return item ? title(item->item()) : QString(); };
        source.detail = [at, detail](int row) {
            const auto item = at(row);
            return item && detail ? detail(item->item()) : QString();
        };
        source.isSelected = [at](int row) { const auto item = at(row); return item && item->isSelected(); };
        source.setSelected = [at](int row, bool selected) {
            if (const auto item = at(row))
                item->setSelected(selected);
        };
        return source;
    }

    explicit SelectableListModel(Source source, QObject* parent = nullptr);

    // The filtered rows changed shape.
    void reload();

    // Only selection flags changed.
    void refreshSelection();

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    bool setData(const QModelIndex& index, const QVariant& value, int role) override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    QHash<int, QByteArray> roleNames() const override;

private:
    Source m_source;
};

} // namespace Kiln::Models
