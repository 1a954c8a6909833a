/**
 * @file attribute_store.hpp
 * @brief Per-element string attributes and the lookup function type.
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Name of the attribute exporters use as an element's label.
 */
inline const std::string k_label_attribute_key = "label";

/**
 * @brief Look up the attribute `key` of an element.
 * @return The attribute value, or `std::nullopt` if the element has none.
 */
template <typename T>
using AttributeLookup =
    std::function<std::optional<std::string>(const T& element, const std::string& key)>;

/**
 * @brief A map from elements to their string attributes.
 *
 * @details
 * Attributes are kept per element as an ordered key/value map. A store can
 * be handed to an exporter through `lookup()`.
 *
 * @par Ownership and lifetime
 * - The function returned by `lookup()` refers to this store; the store must
 *   outlive every use of it.
 *
 * @tparam T Element type. Must be hashable with `std::hash`.
 */
template <typename T>
class AttributeStore
{
public:
    /**
     * @brief Set an attribute, replacing any previous value for the key.
     */
    void put(const T& element, const std::string& key, std::string value)
    {
        m_attributes[element][key] = std::move(value);
    }

    /**
     * @brief Remove an attribute.
     * @return True if the attribute existed.
     */
    bool remove(const T& element, const std::string& key)
    {
        auto it = m_attributes.find(element);
        if (it == m_attributes.end())
        {
            return false;
        }
        bool erased = it->second.erase(key) != 0;
        if (it->second.empty())
        {
            m_attributes.erase(it);
        }
        return erased;
    }

    std::optional<std::string> get(const T& element, const std::string& key) const
    {
        auto it = m_attributes.find(element);
        if (it == m_attributes.end())
        {
            return std::nullopt;
        }
        auto kv = it->second.find(key);
        if (kv == it->second.end())
        {
            return std::nullopt;
        }
        return kv->second;
    }

    /**
     * @brief All attributes of an element, ordered by key. Empty if none.
     */
    std::map<std::string, std::string> attributes_of(const T& element) const
    {
        auto it = m_attributes.find(element);
        if (it == m_attributes.end())
        {
            return {};
        }
        return it->second;
    }

    /**
     * @brief Number of elements with at least one attribute.
     */
    size_t element_count() const noexcept
    {
        return m_attributes.size();
    }

    /**
     * @brief A lookup function backed by this store.
     */
    AttributeLookup<T> lookup() const
    {
        return [this](const T& element, const std::string& key) {
            return get(element, key);
        };
    }

private:
    std::unordered_map<T, std::map<std::string, std::string>> m_attributes;
};

} // namespace gmlio
