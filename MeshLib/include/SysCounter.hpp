#ifndef SYS_COUNTER_HPP_INCLUDED
#define SYS_COUNTER_HPP_INCLUDED

#include <cstdint>
#include <memory>
#include <vector>

/**
 * @brief Shared pointer to a SysCounter.
 */
class SysCounter;
using SysCounterPtr = std::shared_ptr<SysCounter>;

/**
 * @brief Monotonic change stamp with parent propagation.
 *
 * Every `change()` bumps the stamp and forwards the bump to all parents, so a
 * consumer that watches a parent (e.g. the scene graph) sees changes made on
 * any child (e.g. a viewport camera) without knowing about the child.
 */
class SysCounter
{
public:
    SysCounter() = default;

    /**
     * @brief Increments the stamp and notifies all parent counters.
     */
    void change();

    /**
     * @brief Adds a parent that is bumped together with this counter.
     *
     * Null parents and duplicates are ignored.
     */
    void addParent(const SysCounterPtr& parent);

    /**
     * @brief Removes a previously added parent (no-op if absent).
     */
    void removeParent(const SysCounterPtr& parent) noexcept;

    /**
     * @brief Current stamp.
     */
    [[nodiscard]] uint64_t value() const noexcept;

private:
    std::vector<SysCounterPtr> m_parents;
    uint64_t                   m_value{0};
};

/**
 * @brief Watches a SysCounter and reports whether it moved since the last query.
 */
class SysMonitor
{
public:
    SysMonitor() = default;

    /**
     * @brief Constructs a monitor for the given counter.
     * @param counter    Counter to watch.
     * @param startDirty When true the first `changed()` reports a change even
     *                   if the counter never moved.
     */
    explicit SysMonitor(SysCounterPtr counter, bool startDirty = true);

    /**
     * @brief True if the counter moved since the previous call. Consumes the change.
     */
    [[nodiscard]] bool changed() noexcept;

    /**
     * @brief True if the counter moved, without consuming the change.
     */
    [[nodiscard]] bool peek() const noexcept;

    /**
     * @brief Marks the current counter value as seen.
     */
    void sync() noexcept;

private:
    SysCounterPtr m_counter   = {};
    uint64_t      m_prevValue = 0;
    bool          m_dirty     = false;
};

#endif // SYS_COUNTER_HPP_INCLUDED
