#ifndef GMLIO_GRAPH_LIST_GRAPH_INLINE_HPP
#define GMLIO_GRAPH_LIST_GRAPH_INLINE_HPP

#include "gmlio/common/display_string.hpp"
#include "gmlio/graph/list_graph.hpp"

namespace gmlio {

// =============================================================================
// Construction and queries
// =============================================================================

template <typename V, typename E>
ListGraph<V, E>::ListGraph(bool directed, bool weighted)
    : m_directed(directed)
    , m_weighted(weighted)
{
}

template <typename V, typename E>
bool ListGraph<V, E>::is_directed() const
{
    return m_directed;
}

template <typename V, typename E>
bool ListGraph<V, E>::is_weighted() const
{
    return m_weighted;
}

template <typename V, typename E>
size_t ListGraph<V, E>::vertex_count() const
{
    return m_vertices.size();
}

template <typename V, typename E>
size_t ListGraph<V, E>::edge_count() const
{
    return m_edges.size();
}

// =============================================================================
// Mutation
// =============================================================================

template <typename V, typename E>
bool ListGraph<V, E>::add_vertex(const V& vertex)
{
    if (m_vertex_index.count(vertex) != 0) {
        return false;
    }
    m_vertex_index.emplace(vertex, m_vertices.size());
    m_vertices.push_back(vertex);
    return true;
}

template <typename V, typename E>
bool ListGraph<V, E>::contains_vertex(const V& vertex) const
{
    return m_vertex_index.count(vertex) != 0;
}

template <typename V, typename E>
void ListGraph<V, E>::add_edge(const E& edge, const V& source, const V& target, double weight)
{
    if (!contains_vertex(source)) {
        throw GraphError(
            GraphErrorCode::UnknownVertex,
            "Source vertex " + to_display_string(source) + " is not in the graph");
    }
    if (!contains_vertex(target)) {
        throw GraphError(
            GraphErrorCode::UnknownVertex,
            "Target vertex " + to_display_string(target) + " is not in the graph");
    }
    if (m_edge_index.count(edge) != 0) {
        throw GraphError(
            GraphErrorCode::DuplicateEdge,
            "Edge " + to_display_string(edge) + " is already in the graph");
    }

    m_edge_index.emplace(edge, m_edges.size());
    m_edges.push_back(EdgeEntry{
        edge,
        source,
        target,
        m_weighted ? weight : k_default_edge_weight
    });
}

template <typename V, typename E>
bool ListGraph<V, E>::contains_edge(const E& edge) const
{
    return m_edge_index.count(edge) != 0;
}

template <typename V, typename E>
void ListGraph<V, E>::set_edge_weight(const E& edge, double weight)
{
    if (!m_weighted) {
        throw GraphError(
            GraphErrorCode::UnsupportedOperation,
            "Cannot set the weight of edge " + to_display_string(edge) +
                " in an unweighted graph");
    }
    auto it = m_edge_index.find(edge);
    if (it == m_edge_index.end()) {
        throw GraphError(
            GraphErrorCode::UnknownEdge,
            "Edge " + to_display_string(edge) + " is not in the graph");
    }
    m_edges[it->second].weight = weight;
}

// =============================================================================
// Iteration and edge queries
// =============================================================================

template <typename V, typename E>
void ListGraph<V, E>::for_each_vertex(const std::function<void(const V&)>& visit) const
{
    for (const auto& vertex : m_vertices) {
        visit(vertex);
    }
}

template <typename V, typename E>
void ListGraph<V, E>::for_each_edge(const std::function<void(const E&)>& visit) const
{
    for (const auto& entry : m_edges) {
        visit(entry.edge);
    }
}

template <typename V, typename E>
V ListGraph<V, E>::edge_source(const E& edge) const
{
    return find_edge(edge).source;
}

template <typename V, typename E>
V ListGraph<V, E>::edge_target(const E& edge) const
{
    return find_edge(edge).target;
}

template <typename V, typename E>
double ListGraph<V, E>::edge_weight(const E& edge) const
{
    return find_edge(edge).weight;
}

template <typename V, typename E>
const typename ListGraph<V, E>::EdgeEntry& ListGraph<V, E>::find_edge(const E& edge) const
{
    auto it = m_edge_index.find(edge);
    if (it == m_edge_index.end()) {
        throw GraphError(
            GraphErrorCode::UnknownEdge,
            "Edge " + to_display_string(edge) + " is not in the graph");
    }
    return m_edges[it->second];
}

} // namespace gmlio

#endif // GMLIO_GRAPH_LIST_GRAPH_INLINE_HPP
