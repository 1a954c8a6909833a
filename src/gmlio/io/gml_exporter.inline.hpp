#ifndef GMLIO_IO_GML_EXPORTER_INLINE_HPP
#define GMLIO_IO_GML_EXPORTER_INLINE_HPP

#include "gmlio/common/display_string.hpp"
#include "gmlio/common/logging.hpp"
#include "gmlio/common/string_escape.hpp"
#include "gmlio/common/weight_format.hpp"
#include "gmlio/io/gml_exporter.hpp"

#include <fstream>

namespace gmlio {

namespace gml_detail {

inline constexpr const char* k_creator = "JGraphT GML Exporter";
inline constexpr const char* k_version = "1";

inline constexpr const char* k_delim = " ";
inline constexpr const char* k_tab1 = "\t";
inline constexpr const char* k_tab2 = "\t\t";

} // namespace gml_detail

// =============================================================================
// Construction and configuration
// =============================================================================

template <typename V, typename E>
GmlExporter<V, E>::GmlExporter()
    : GmlExporter(IdProvider<V>(IntegerIdProvider<V>()))
{
}

template <typename V, typename E>
GmlExporter<V, E>::GmlExporter(IdProvider<V> vertex_id_provider)
{
    set_vertex_id_provider(std::move(vertex_id_provider));
}

template <typename V, typename E>
bool GmlExporter<V, E>::is_parameter_set(GmlParameter parameter) const
{
    return m_parameters.is_set(parameter);
}

template <typename V, typename E>
void GmlExporter<V, E>::set_parameter(GmlParameter parameter, bool value)
{
    m_parameters.set(parameter, value);
}

template <typename V, typename E>
void GmlExporter<V, E>::set_vertex_id_provider(IdProvider<V> provider)
{
    if (!provider) {
        throw ExportError(
            ExportErrorCode::InvalidArgument, "Vertex id provider must not be empty");
    }
    m_vertex_id_provider = std::move(provider);
}

template <typename V, typename E>
void GmlExporter<V, E>::set_edge_id_provider(std::optional<IdProvider<E>> provider)
{
    if (provider && !*provider) {
        throw ExportError(
            ExportErrorCode::InvalidArgument,
            "Edge id provider must not be empty; pass std::nullopt to clear it");
    }
    m_edge_id_provider = std::move(provider);
}

template <typename V, typename E>
void GmlExporter<V, E>::set_vertex_attribute_lookup(AttributeLookup<V> lookup)
{
    m_vertex_attributes = std::move(lookup);
}

template <typename V, typename E>
void GmlExporter<V, E>::set_edge_attribute_lookup(AttributeLookup<E> lookup)
{
    m_edge_attributes = std::move(lookup);
}

// =============================================================================
// Export
// =============================================================================

template <typename V, typename E>
void GmlExporter<V, E>::export_graph(const IGraphView<V, E>& graph, std::ostream& out) const
{
    using namespace gml_detail;

    auto log = logger();
    if (log->should_log(spdlog::level::debug)) {
        log->debug("GML export started: vertices={} edges={} directed={} weighted={} parameters={}",
                   graph.vertex_count(), graph.edge_count(), graph.is_directed(),
                   graph.is_weighted(), m_parameters.describe());
    }

    IdentifierAssigner<V, E> ids(m_vertex_id_provider, m_edge_id_provider);

    // Assign ids in vertex iteration order before any edge refers to them.
    graph.for_each_vertex([&ids](const V& vertex) { ids.vertex_id(vertex); });

    try {
        export_header(out);
        write_line(out, "graph");
        write_line(out, "[");
        write_line(out, std::string(k_tab1) + "label" + k_delim + quoted(""));
        write_line(out, std::string(k_tab1) + "directed" + k_delim +
                            (graph.is_directed() ? "1" : "0"));
        export_vertices(out, graph, ids);
        export_edges(out, graph, ids);
        write_line(out, "]");

        out.flush();
        if (!out) {
            throw ExportError(ExportErrorCode::SinkFailure, "Failed to flush GML output");
        }
    }
    catch (const std::ios_base::failure& e) {
        log->error("GML export failed: {}", e.what());
        throw ExportError(
            ExportErrorCode::SinkFailure, std::string("Failed to write GML output: ") + e.what());
    }
    catch (const ExportError& e) {
        log->error("GML export failed: {}", e.what());
        throw;
    }

    log->debug("GML export finished: {} vertex ids assigned", ids.assigned_count());
}

template <typename V, typename E>
void GmlExporter<V, E>::export_graph(const IGraphView<V, E>& graph, const std::string& path) const
{
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        logger()->error("Cannot open {} for writing", path);
        throw ExportError(
            ExportErrorCode::SinkFailure, "Cannot open " + path + " for writing");
    }

    export_graph(graph, file);

    file.close();
    if (file.fail()) {
        logger()->error("Failed to close {}", path);
        throw ExportError(ExportErrorCode::SinkFailure, "Failed to close " + path);
    }
}

// =============================================================================
// Sections
// =============================================================================

template <typename V, typename E>
void GmlExporter<V, E>::export_header(std::ostream& out) const
{
    using namespace gml_detail;

    write_line(out, std::string("Creator") + k_delim + quoted(k_creator));
    write_line(out, std::string("Version") + k_delim + k_version);
}

template <typename V, typename E>
void GmlExporter<V, E>::export_vertices(std::ostream& out, const IGraphView<V, E>& graph,
                                        IdentifierAssigner<V, E>& ids) const
{
    using namespace gml_detail;

    const bool export_labels = m_parameters.is_set(GmlParameter::ExportVertexLabels);

    graph.for_each_vertex([&](const V& vertex) {
        write_line(out, std::string(k_tab1) + "node");
        write_line(out, std::string(k_tab1) + "[");
        write_line(out, std::string(k_tab2) + "id" + k_delim + ids.vertex_id(vertex));
        if (export_labels) {
            write_line(out, std::string(k_tab2) + "label" + k_delim + quoted(vertex_label(vertex)));
        }
        write_line(out, std::string(k_tab1) + "]");
    });
}

template <typename V, typename E>
void GmlExporter<V, E>::export_edges(std::ostream& out, const IGraphView<V, E>& graph,
                                     IdentifierAssigner<V, E>& ids) const
{
    using namespace gml_detail;

    const bool export_labels = m_parameters.is_set(GmlParameter::ExportEdgeLabels);
    const bool export_weights =
        m_parameters.is_set(GmlParameter::ExportEdgeWeights) && graph.is_weighted();

    graph.for_each_edge([&](const E& edge) {
        write_line(out, std::string(k_tab1) + "edge");
        write_line(out, std::string(k_tab1) + "[");

        if (auto edge_id = ids.edge_id(edge)) {
            write_line(out, std::string(k_tab2) + "id" + k_delim + *edge_id);
        }
        write_line(out, std::string(k_tab2) + "source" + k_delim +
                            ids.vertex_id(graph.edge_source(edge)));
        write_line(out, std::string(k_tab2) + "target" + k_delim +
                            ids.vertex_id(graph.edge_target(edge)));
        if (export_labels) {
            write_line(out, std::string(k_tab2) + "label" + k_delim + quoted(edge_label(edge)));
        }
        if (export_weights) {
            write_line(out, std::string(k_tab2) + "weight" + k_delim +
                                format_weight(graph.edge_weight(edge)));
        }

        write_line(out, std::string(k_tab1) + "]");
    });
}

// =============================================================================
// Helpers
// =============================================================================

template <typename V, typename E>
std::string GmlExporter<V, E>::quoted(const std::string& text) const
{
    if (m_parameters.is_set(GmlParameter::EscapeStringsAsText)) {
        return "\"" + escape_as_text(text) + "\"";
    }
    return "\"" + text + "\"";
}

template <typename V, typename E>
std::string GmlExporter<V, E>::vertex_label(const V& vertex) const
{
    if (m_vertex_attributes) {
        if (auto label = m_vertex_attributes(vertex, k_label_attribute_key)) {
            return *label;
        }
    }
    return to_display_string(vertex);
}

template <typename V, typename E>
std::string GmlExporter<V, E>::edge_label(const E& edge) const
{
    if (m_edge_attributes) {
        if (auto label = m_edge_attributes(edge, k_label_attribute_key)) {
            return *label;
        }
    }
    return to_display_string(edge);
}

template <typename V, typename E>
void GmlExporter<V, E>::write_line(std::ostream& out, const std::string& line)
{
    out << line << '\n';
    if (!out) {
        throw ExportError(ExportErrorCode::SinkFailure, "Failed to write GML output");
    }
}

} // namespace gmlio

#endif // GMLIO_IO_GML_EXPORTER_INLINE_HPP
