//============================================================
// ItemFactory.hpp
//============================================================
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @class ItemFactory
 * @brief Registry mapping string keys to constructors of T.
 *
 * Used to select pluggable backends by name at runtime, for example the
 * scene query implementations:
 *
 * @code
 * ItemFactory<SceneQuery> queries;
 * queries.registerItem("cpu", &ItemFactory<SceneQuery>::createItemType<SceneQueryCpu>);
 * auto query = queries.createItem("cpu");
 * @endcode
 *
 * @tparam T Base type of items created by the factory.
 */
template<typename T>
class ItemFactory
{
public:
    ItemFactory() = default;

    /// Callable that constructs a new item.
    using CreateFunc = std::function<std::unique_ptr<T>()>;

    /**
     * @brief Register a new item type under a name.
     *
     * Registers a factory function that creates an instance of a derived class.
     * If the name already exists, the previous entry is replaced.
     *
     * @param name       Unique string identifier for the item type.
     * @param createFunc Function that constructs a new instance.
     */
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        m_registry[name] = std::move(createFunc);
    }

    /// True if @p name has a registered constructor.
    [[nodiscard]] bool contains(const std::string& name) const
    {
        return m_registry.find(name) != m_registry.end();
    }

    /// Registered keys, unordered.
    [[nodiscard]] std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(m_registry.size());
        for (const auto& [name, fn] : m_registry)
            out.push_back(name);
        return out;
    }

    /**
     * @brief Create an item instance by name.
     *
     * @param name Registered string key.
     * @return A newly constructed unique_ptr<T>, or nullptr if not found.
     */
    std::unique_ptr<T> createItem(const std::string& name) const
    {
        if (auto it = m_registry.find(name); it != m_registry.end())
        {
            return it->second();
        }
        return nullptr;
    }

    /**
     * @brief Helper function that constructs items of a specific derived type.
     *
     * @tparam Derived The concrete type to construct (must derive from T).
     * @return std::unique_ptr<Derived> Newly allocated item.
     */
    template<typename Derived>
    static std::unique_ptr<Derived> createItemType()
    {
        return std::make_unique<Derived>();
    }

private:
    /// Map of registered item names to constructor functions.
    std::unordered_map<std::string, CreateFunc> m_registry;
};
