// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "app/models/SelectableListModel.hpp"

#include <utility>

namespace Kiln::Models {

SelectableListModel::SelectableListModel(Source source, QObject* parent)
    : QAbstractListModel(parent)
    , m_source(std::move(source))
{}

void SelectableListModel::reload()
{
    beginResetModel();
    endResetModel();
}

void SelectableListModel::refreshSelection()
{
    const int rows = rowCount();
    if (rows == 0)
        return;
    emit dataChanged(index(0, 0), index(rows - 1, 0), {Qt::CheckStateRole, SelectedRole});
}

int SelectableListModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid() || !m_source.count)
        return 0;
    return m_source.count();
}

QVariant SelectableListModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() >= rowCount())
        return {};

    const int row = index.row();
    switch (role) {
    case Qt::DisplayRole:
        return m_source.title(row);
    case Qt::ToolTipRole:
    case DetailRole:
        return m_source.detail(row);
    case Qt::CheckStateRole:
        return m_source.isSelected(row) ? Qt::Checked : Qt::Unchecked;
    case SelectedRole:
        return m_source.isSelected(row);
    case KeyRole:
        return m_source.key(row);
    default:
        return {};
    }
}

bool SelectableListModel::setData(const QModelIndex& index, const QVariant& value, int role)
{
    if (!index.isValid() || index.row() >= rowCount())
        return false;

    bool selected = false;
    if (role == Qt::CheckStateRole)
        selected = value.toInt() == Qt::Checked;
    else if (role == SelectedRole)
        selected = value.toBool();
    else
        return false;

    // The collection reports back through refreshSelection().
    m_source.setSelected(index.row(), selected);
    return true;
}

Qt::ItemFlags SelectableListModel::flags(const QModelIndex& index) const
{
    if (!index.isValid())
        return Qt::NoItemFlags;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsUserCheckable | Qt::ItemNeverHasChildren;
}

QHash<int, QByteArray> SelectableListModel::roleNames() const
{
    QHash<int, QByteArray> names = QAbstractListModel::roleNames();
    names.insert(KeyRole, "key");
    names.insert(SelectedRole, "selected");
    names.insert(DetailRole, "detail");
    return names;
}

} // namespace Kiln::Models
