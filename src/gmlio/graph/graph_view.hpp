/**
 * @file graph_view.hpp
 * @brief Read-only query interface consumed by exporters.
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Default weight reported for edges of unweighted graphs.
 */
inline constexpr double k_default_edge_weight = 1.0;

/**
 * @brief Read-only view of a graph with vertex type `V` and edge type `E`.
 *
 * @details
 * This is the only access an exporter has to a graph. Implementations decide
 * the iteration order of vertices and edges; exporters reproduce that order
 * exactly, so an implementation with a stable order yields deterministic
 * output.
 *
 * @par Contract
 * - `for_each_vertex()` visits every vertex exactly once.
 * - `for_each_edge()` visits every edge exactly once.
 * - `edge_source()`, `edge_target()` and `edge_weight()` are only called with
 *   edges obtained from `for_each_edge()`.
 * - For an undirected graph, source and target are the endpoints in the order
 *   the edge was added.
 * - `edge_weight()` returns `k_default_edge_weight` for unweighted graphs.
 *
 * @par Thread safety
 * - Exporters only call const methods; concurrent reads are safe if the
 *   implementation's const methods are.
 */
template <typename V, typename E>
class IGraphView
{
public:
    using VertexType = V;
    using EdgeType = E;

    virtual ~IGraphView() = default;

    virtual bool is_directed() const = 0;
    virtual bool is_weighted() const = 0;

    virtual size_t vertex_count() const = 0;
    virtual size_t edge_count() const = 0;

    virtual void for_each_vertex(const std::function<void(const V&)>& visit) const = 0;
    virtual void for_each_edge(const std::function<void(const E&)>& visit) const = 0;

    virtual V edge_source(const E& edge) const = 0;
    virtual V edge_target(const E& edge) const = 0;
    virtual double edge_weight(const E& edge) const = 0;
};

} // namespace gmlio
