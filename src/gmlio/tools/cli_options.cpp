/**
 * @file cli_options.cpp
 */
#include "gmlio/tools/cli_options.hpp"

namespace gmlio
{

GmlParameters to_parameters(const CliOptions& opt)
{
    GmlParameters parameters;
    parameters.set(GmlParameter::ExportVertexLabels, opt.vertex_labels);
    parameters.set(GmlParameter::ExportEdgeLabels, opt.edge_labels);
    parameters.set(GmlParameter::ExportEdgeWeights, opt.edge_weights);
    parameters.set(GmlParameter::EscapeStringsAsText, opt.escape);
    return parameters;
}

EdgeListOptions to_edge_list_options(const CliOptions& opt)
{
    EdgeListOptions options;
    options.directed = opt.directed;
    options.weighted = opt.weighted;
    return options;
}

IdProvider<size_t> edge_index_id_provider()
{
    return [](const size_t& edge) { return std::to_string(edge); };
}

void configure_exporter(const CliOptions& opt, const EdgeListDocument& document,
                        GmlExporter<std::string, size_t>& exporter)
{
    exporter.set_parameters(to_parameters(opt));
    exporter.set_edge_attribute_lookup(document.edge_attributes.lookup());
    if (opt.edge_ids)
    {
        exporter.set_edge_id_provider(edge_index_id_provider());
    }
    else
    {
        exporter.set_edge_id_provider(std::nullopt);
    }
}

} // namespace gmlio
