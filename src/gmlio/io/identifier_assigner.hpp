/**
 * @file identifier_assigner.hpp
 */
#pragma once
#include "gmlio/common/common.hpp"
#include "gmlio/io/id_provider.hpp"

namespace gmlio
{

/**
 * @brief Per-export table of the ids written for vertices and edges.
 *
 * @details
 * A vertex receives its id on the first `vertex_id()` call for it; later
 * calls return the same string without consulting the provider again. The
 * order in which ids are handed out is therefore the order of first lookup,
 * which the exporter controls by looking up every vertex before it writes
 * anything.
 *
 * Edge ids are optional: without an edge provider `edge_id()` returns
 * `std::nullopt` and the exporter omits the edge's `id` field.
 *
 * @par Ownership and lifetime
 * - Holds references to the providers; they must outlive the assigner.
 * - Intended to live for exactly one export call.
 */
template <typename V, typename E>
class IdentifierAssigner
{
public:
    IdentifierAssigner(const IdProvider<V>& vertex_provider,
                       const std::optional<IdProvider<E>>& edge_provider)
        : m_vertex_provider(vertex_provider)
        , m_edge_provider(edge_provider)
    {
    }

    IdentifierAssigner(const IdentifierAssigner&) = delete;
    IdentifierAssigner& operator=(const IdentifierAssigner&) = delete;

    const std::string& vertex_id(const V& vertex)
    {
        auto it = m_vertex_ids.find(vertex);
        if (it == m_vertex_ids.end())
        {
            it = m_vertex_ids.emplace(vertex, m_vertex_provider(vertex)).first;
        }
        return it->second;
    }

    std::optional<std::string> edge_id(const E& edge) const
    {
        if (!m_edge_provider)
        {
            return std::nullopt;
        }
        return (*m_edge_provider)(edge);
    }

    /**
     * @brief Number of vertices with an assigned id.
     */
    size_t assigned_count() const noexcept
    {
        return m_vertex_ids.size();
    }

private:
    const IdProvider<V>& m_vertex_provider;
    const std::optional<IdProvider<E>>& m_edge_provider;
    std::unordered_map<V, std::string> m_vertex_ids;
};

} // namespace gmlio
