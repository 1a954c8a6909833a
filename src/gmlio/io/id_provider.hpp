/**
 * @file id_provider.hpp
 * @brief Identifier provider function type and the default integer provider.
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Compute the identifier written for a graph element.
 *
 * @details
 * Exporters trust the provider to return distinct ids for distinct elements.
 * Non-distinct ids produce a document that references the wrong nodes, but
 * are not detected.
 */
template <typename T>
using IdProvider = std::function<std::string(const T&)>;

/**
 * @brief Assigns consecutive integers to elements in first-request order.
 *
 * @details
 * The first distinct element requested gets `start`, the next `start + 1`,
 * and so on. An element requested again gets the id it was first given, so
 * exporting the same graph twice with one provider yields the same ids.
 *
 * @par Value semantics
 * - Copies share one sequence and one cache (held by `std::shared_ptr`), so
 *   the provider can be wrapped in an `IdProvider<T>` and still be queried.
 *
 * @par Thread safety
 * - No internal synchronization.
 *
 * @tparam T Element type. Must be hashable with `std::hash`.
 */
template <typename T>
class IntegerIdProvider
{
public:
    explicit IntegerIdProvider(long long start = 0)
        : m_state(std::make_shared<State>())
    {
        m_state->next_id = start;
    }

    std::string operator()(const T& element) const
    {
        auto it = m_state->ids.find(element);
        if (it != m_state->ids.end())
        {
            return it->second;
        }
        std::string id = std::to_string(m_state->next_id++);
        m_state->ids.emplace(element, id);
        return id;
    }

    /**
     * @brief Number of distinct elements given an id so far.
     */
    size_t assigned_count() const noexcept
    {
        return m_state->ids.size();
    }

private:
    struct State
    {
        long long next_id = 0;
        std::unordered_map<T, std::string> ids;
    };

    std::shared_ptr<State> m_state;
};

} // namespace gmlio
