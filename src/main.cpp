#include "gmlio/common/logging.hpp"
#include "gmlio/io/gml_exporter.hpp"
#include "gmlio/tools/cli_options.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

gmlio::EdgeListDocument read_input(const gmlio::CliOptions& opt)
{
    gmlio::EdgeListOptions list_options = gmlio::to_edge_list_options(opt);

    if (opt.input_path.empty() || opt.input_path == "-")
    {
        return gmlio::read_edge_list(std::cin, list_options);
    }
    std::ifstream file(opt.input_path);
    if (!file)
    {
        throw std::runtime_error("Cannot open " + opt.input_path + " for reading");
    }
    return gmlio::read_edge_list(file, list_options);
}

} // namespace

int main(int argc, char** argv)
{
    gmlio::CliOptions opt{};

    CLI::App app{"Convert a whitespace separated edge list to GML"};
    app.add_option("input", opt.input_path, "Edge list file (default: standard input)");
    app.add_option("-o,--output", opt.output_path, "Output file (default: standard output)");
    app.add_flag("--directed", opt.directed, "Treat edges as directed");
    app.add_flag("--weighted", opt.weighted, "Keep edge weights from the input");
    app.add_flag("--vertex-labels", opt.vertex_labels, "Write vertex labels");
    app.add_flag("--edge-labels", opt.edge_labels, "Write edge labels");
    app.add_flag("--edge-weights", opt.edge_weights, "Write edge weights");
    app.add_flag("--escape", opt.escape, "Escape quoted strings");
    app.add_flag("--edge-ids", opt.edge_ids, "Write edge ids (input order, from 0)");
    app.add_option("--log-level", opt.log_level, "trace, debug, info, warn, error, critical or off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.allow_extras(false);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    try
    {
        gmlio::set_log_level(opt.log_level);

        gmlio::EdgeListDocument document = read_input(opt);

        gmlio::GmlExporter<std::string, size_t> exporter;
        gmlio::configure_exporter(opt, document, exporter);

        if (opt.output_path.empty() || opt.output_path == "-")
        {
            exporter.export_graph(document.graph, std::cout);
        }
        else
        {
            exporter.export_graph(document.graph, opt.output_path);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
