// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <functional>
#include <utility>

namespace Utils::Reactive {

template <typename T>
class SelectableItem final {
public:
    using SelectionHook = std::function<void(SelectableItem&)>;

    explicit SelectableItem(T item)
        : m_item(std::move(item))
    {}

    SelectableItem(const SelectableItem&) = delete;
    SelectableItem& operator=(const SelectableItem&) = delete;

    const T& item() const noexcept { return m_item; }
    void setItem(T item) { m_item = std::move(item); }

    bool isSelected() const noexcept { return m_selected; }

    void setSelected(bool selected)
    {
        if (m_selected == selected)
            return;
        m_selected = selected;
        if (m_hook)
            m_hook(*this);
    }

    void toggle() { setSelected(!m_selected); }

    // Installed by the owning collection; runs synchronously inside setSelected().
    void setSelectionHook(SelectionHook hook) { m_hook = std::move(hook); }

private:
    T m_item;
    bool m_selected = false;
    SelectionHook m_hook;
};

} // namespace Utils::Reactive
