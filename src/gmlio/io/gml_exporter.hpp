/**
 * @file gml_exporter.hpp
 * @brief Export of graphs to GML (Graph Modeling Language) text.
 */
#pragma once
#include "gmlio/common/common.hpp"
#include "gmlio/graph/attribute_store.hpp"
#include "gmlio/graph/graph_view.hpp"
#include "gmlio/io/export_exceptions.hpp"
#include "gmlio/io/gml_parameters.hpp"
#include "gmlio/io/id_provider.hpp"
#include "gmlio/io/identifier_assigner.hpp"

namespace gmlio
{

/**
 * @brief Writes a graph as a GML document.
 *
 * @details
 * The document has a fixed layout:
 * @code
 * Creator "JGraphT GML Exporter"
 * Version 1
 * graph
 * [
 *     label ""
 *     directed 1
 *     node
 *     [
 *         id 0
 *         label "a"
 *     ]
 *     edge
 *     [
 *         id e0
 *         source 0
 *         target 1
 *         label "a to b"
 *         weight 2.5
 *     ]
 * ]
 * @endcode
 * Indentation is one tab per level and every line ends with `\n`. Node
 * labels, edge labels and edge weights appear only when the matching
 * `GmlParameter` is set (weights also need a weighted graph); edge ids appear
 * only when an edge id provider is configured.
 *
 * @par Identifiers
 * Before writing, every vertex is assigned its id in the graph's vertex
 * iteration order, so edge iteration order never affects which vertex gets
 * which id. The default vertex id provider is an `IntegerIdProvider<V>`
 * starting at 0.
 *
 * @par Labels
 * A label is the element's "label" attribute if the attribute lookup has
 * one, else `to_display_string()` of the element. Labels are wrapped in
 * double quotes; with `EscapeStringsAsText` they are passed through
 * `escape_as_text()` first. Without it they are written verbatim, so a label
 * containing `"` or a line break produces a malformed document.
 *
 * @par Errors
 * A failing output stream raises `ExportError` with `SinkFailure` as soon as
 * the failed line is detected; the partial output is not cleaned up.
 *
 * @par Thread safety
 * - `export_graph()` keeps its id table local to the call.
 * - The default vertex id provider has shared mutable state; concurrent
 *   exports on one exporter require external synchronization.
 *
 * @tparam V Vertex type. Must be hashable with `std::hash`.
 * @tparam E Edge type.
 */
template <typename V, typename E>
class GmlExporter
{
public:
    /**
     * @brief Construct an exporter using integer vertex ids.
     */
    GmlExporter();

    /**
     * @brief Construct an exporter with the given vertex id provider.
     * @throw ExportError with `InvalidArgument` if the provider is empty.
     */
    explicit GmlExporter(IdProvider<V> vertex_id_provider);

    /**
     * @brief Write `graph` to `out` and flush it.
     * @throw ExportError with `SinkFailure` if writing to `out` fails.
     */
    void export_graph(const IGraphView<V, E>& graph, std::ostream& out) const;

    /**
     * @brief Write `graph` to the file at `path`, replacing its contents.
     * @throw ExportError with `SinkFailure` if the file cannot be opened or
     *        written.
     */
    void export_graph(const IGraphView<V, E>& graph, const std::string& path) const;

    bool is_parameter_set(GmlParameter parameter) const;

    void set_parameter(GmlParameter parameter, bool value);

    const GmlParameters& parameters() const noexcept
    {
        return m_parameters;
    }

    /**
     * @brief Replace all parameters at once.
     */
    void set_parameters(const GmlParameters& parameters)
    {
        m_parameters = parameters;
    }

    /**
     * @throw ExportError with `InvalidArgument` if the provider is empty.
     */
    void set_vertex_id_provider(IdProvider<V> provider);

    /**
     * @brief Set or clear (`std::nullopt`) the edge id provider.
     * @throw ExportError with `InvalidArgument` if a provider is given but
     *        empty.
     */
    void set_edge_id_provider(std::optional<IdProvider<E>> provider);

    /**
     * @brief Set the vertex attribute lookup. An empty function means no
     *        vertex has attributes.
     */
    void set_vertex_attribute_lookup(AttributeLookup<V> lookup);

    /**
     * @brief Set the edge attribute lookup. An empty function means no edge
     *        has attributes.
     */
    void set_edge_attribute_lookup(AttributeLookup<E> lookup);

private:
    std::string quoted(const std::string& text) const;

    void export_header(std::ostream& out) const;
    void export_vertices(std::ostream& out, const IGraphView<V, E>& graph,
                         IdentifierAssigner<V, E>& ids) const;
    void export_edges(std::ostream& out, const IGraphView<V, E>& graph,
                      IdentifierAssigner<V, E>& ids) const;

    std::string vertex_label(const V& vertex) const;
    std::string edge_label(const E& edge) const;

    /// Write one line and throw if the stream has failed.
    static void write_line(std::ostream& out, const std::string& line);

private:
    IdProvider<V> m_vertex_id_provider;
    std::optional<IdProvider<E>> m_edge_id_provider;
    AttributeLookup<V> m_vertex_attributes;
    AttributeLookup<E> m_edge_attributes;
    GmlParameters m_parameters;
};

} // namespace gmlio

#include "gmlio/io/gml_exporter.inline.hpp"
