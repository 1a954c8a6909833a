/**
 * @file list_graph.hpp
 * @brief Insertion-ordered in-memory graph.
 */
#pragma once
#include "gmlio/common/common.hpp"
#include "gmlio/graph/graph_exceptions.hpp"
#include "gmlio/graph/graph_view.hpp"

namespace gmlio
{

/**
 * @brief A simple graph storing vertices and edges in insertion order.
 *
 * @details
 * `ListGraph` is the reference implementation of `IGraphView`. Vertices and
 * edges are user-supplied values; both are iterated in the order they were
 * added, which makes exports of a `ListGraph` reproducible.
 *
 * @par Graph type
 * Directedness and weightedness are fixed at construction. Self-loops and
 * parallel edges (distinct edge values between the same endpoints) are
 * allowed.
 *
 * @par Requirements on V and E
 * - Copyable, equality comparable and hashable with `std::hash`.
 * - Edge values identify edges, so each edge needs a distinct value.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe if no concurrent writes occur.
 */
template <typename V, typename E>
class ListGraph : public IGraphView<V, E>
{
public:
    /**
     * @param directed Whether edges are directed.
     * @param weighted Whether edges carry an individual weight.
     */
    ListGraph(bool directed, bool weighted);

    bool is_directed() const override;
    bool is_weighted() const override;

    size_t vertex_count() const override;
    size_t edge_count() const override;

    /**
     * @brief Add a vertex.
     * @return True if the vertex was added, false if it was already present.
     */
    bool add_vertex(const V& vertex);

    /**
     * @brief Check whether a vertex is present.
     */
    bool contains_vertex(const V& vertex) const;

    /**
     * @brief Add an edge between two existing vertices.
     * @param edge The edge value. Must not already be in the graph.
     * @param source The source vertex (first endpoint if undirected).
     * @param target The target vertex (second endpoint if undirected).
     * @param weight The edge weight. Ignored by unweighted graphs.
     * @throw GraphError with `UnknownVertex` if an endpoint is missing, or
     *        `DuplicateEdge` if the edge value is already in the graph.
     */
    void add_edge(const E& edge, const V& source, const V& target,
                  double weight = k_default_edge_weight);

    /**
     * @brief Check whether an edge is present.
     */
    bool contains_edge(const E& edge) const;

    /**
     * @brief Change the weight of an edge.
     * @throw GraphError with `UnsupportedOperation` if the graph is unweighted,
     *        or `UnknownEdge` if the edge is missing.
     */
    void set_edge_weight(const E& edge, double weight);

    /**
     * @brief Vertices in insertion order.
     */
    const std::vector<V>& vertices() const noexcept
    {
        return m_vertices;
    }

    void for_each_vertex(const std::function<void(const V&)>& visit) const override;
    void for_each_edge(const std::function<void(const E&)>& visit) const override;

    /**
     * @throw GraphError with `UnknownEdge` if the edge is missing.
     */
    V edge_source(const E& edge) const override;

    /**
     * @throw GraphError with `UnknownEdge` if the edge is missing.
     */
    V edge_target(const E& edge) const override;

    /**
     * @return The stored weight, or `k_default_edge_weight` if the graph is
     *         unweighted.
     * @throw GraphError with `UnknownEdge` if the edge is missing.
     */
    double edge_weight(const E& edge) const override;

private:
    struct EdgeEntry
    {
        E edge;
        V source;
        V target;
        double weight;
    };

    const EdgeEntry& find_edge(const E& edge) const;

private:
    bool m_directed;
    bool m_weighted;

    /// Vertices in insertion order.
    std::vector<V> m_vertices;

    /// Position of each vertex in m_vertices.
    std::unordered_map<V, size_t> m_vertex_index;

    /// Edges in insertion order.
    std::vector<EdgeEntry> m_edges;

    /// Position of each edge in m_edges.
    std::unordered_map<E, size_t> m_edge_index;
};

} // namespace gmlio

#include "gmlio/graph/list_graph.inline.hpp"
