/**
 * @file cli_options.hpp
 * @brief Options of the gmlio_export tool and their mapping onto the library.
 */
#pragma once
#include "gmlio/common/common.hpp"
#include "gmlio/io/gml_exporter.hpp"
#include "gmlio/tools/edge_list_reader.hpp"

namespace gmlio
{

/**
 * @brief Command-line options of `gmlio_export`, as filled by the parser.
 */
struct CliOptions
{
    std::string input_path;
    std::string output_path;
    std::string log_level{"warn"};
    bool directed{false};
    bool weighted{false};
    bool vertex_labels{false};
    bool edge_labels{false};
    bool edge_weights{false};
    bool escape{false};
    bool edge_ids{false};
};

GmlParameters to_parameters(const CliOptions& opt);

EdgeListOptions to_edge_list_options(const CliOptions& opt);

/**
 * @brief Edge ids for `--edge-ids`: the edge's input position, from 0.
 */
IdProvider<size_t> edge_index_id_provider();

/**
 * @brief Apply every exporter-related option to `exporter`.
 *
 * @details
 * Sets the parameters, installs the document's edge labels as the edge
 * attribute lookup, and sets or clears the edge id provider.
 *
 * @note The exporter keeps a lookup referring to `document`; the document
 *       must outlive its use.
 */
void configure_exporter(const CliOptions& opt, const EdgeListDocument& document,
                        GmlExporter<std::string, size_t>& exporter);

} // namespace gmlio
