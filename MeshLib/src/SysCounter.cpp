#include "SysCounter.hpp"

#include <algorithm>

void SysCounter::change()
{
    ++m_value;

    for (const SysCounterPtr& parent : m_parents)
    {
        if (parent)
            parent->change();
    }
}

void SysCounter::addParent(const SysCounterPtr& parent)
{
    if (!parent || parent.get() == this)
        return;

    if (std::find(m_parents.begin(), m_parents.end(), parent) != m_parents.end())
        return;

    m_parents.push_back(parent);
}

void SysCounter::removeParent(const SysCounterPtr& parent) noexcept
{
    std::erase(m_parents, parent);
}

uint64_t SysCounter::value() const noexcept
{
    return m_value;
}

/// ---------------------------------------------
/// SysMonitor implementation
/// ---------------------------------------------

SysMonitor::SysMonitor(SysCounterPtr counter, bool startDirty) :
    m_counter{std::move(counter)},
    m_prevValue{m_counter ? m_counter->value() : 0},
    m_dirty{startDirty}
{
}

bool SysMonitor::changed() noexcept
{
    const bool moved = peek();
    sync();
    return moved;
}

bool SysMonitor::peek() const noexcept
{
    if (m_dirty)
        return true;

    return m_counter && m_counter->value() != m_prevValue;
}

void SysMonitor::sync() noexcept
{
    m_dirty = false;
    if (m_counter)
        m_prevValue = m_counter->value();
}
