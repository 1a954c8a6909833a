/**
 * @file edge_list_reader_tests.cpp
 */
#include <gtest/gtest.h>
#include "gmlio/io/gml_exporter.hpp"
#include "gmlio/tools/edge_list_reader.hpp"

using namespace gmlio;

namespace
{

EdgeListDocument read(const std::string& text, bool directed = false, bool weighted = false)
{
    std::istringstream in(text);
    EdgeListOptions options;
    options.directed = directed;
    options.weighted = weighted;
    return read_edge_list(in, options);
}

} // namespace

TEST(EdgeListReaderTests, Vertices_FirstAppearanceOrder)
{
    EdgeListDocument doc = read("b a\nc b\nd\n");

    EXPECT_EQ(doc.graph.vertices(), (std::vector<std::string>{"b", "a", "c", "d"}));
    EXPECT_EQ(doc.graph.edge_count(), 2u);
    EXPECT_EQ(doc.graph.edge_source(0), "b");
    EXPECT_EQ(doc.graph.edge_target(1), "b");
}

TEST(EdgeListReaderTests, Lines_CommentsAndBlanksSkipped)
{
    EdgeListDocument doc = read("# header\n\n   \n#x y\na b # not a comment\n");

    EXPECT_EQ(doc.graph.vertex_count(), 2u);
    EXPECT_EQ(doc.graph.edge_count(), 1u);
    EXPECT_EQ(*doc.edge_attributes.get(0, k_label_attribute_key), "# not a comment");
}

TEST(EdgeListReaderTests, Weights_KeptWhenWeighted)
{
    EdgeListDocument doc = read("a b 2.5\nb c -1e3\nc a\n", true, true);

    EXPECT_TRUE(doc.graph.is_directed());
    EXPECT_DOUBLE_EQ(doc.graph.edge_weight(0), 2.5);
    EXPECT_DOUBLE_EQ(doc.graph.edge_weight(1), -1000.0);
    EXPECT_DOUBLE_EQ(doc.graph.edge_weight(2), 1.0);
    EXPECT_FALSE(doc.edge_attributes.get(0, k_label_attribute_key).has_value());
}

TEST(EdgeListReaderTests, Weights_DroppedWhenUnweighted)
{
    EdgeListDocument doc = read("a b 2.5\n");

    EXPECT_FALSE(doc.graph.is_weighted());
    EXPECT_DOUBLE_EQ(doc.graph.edge_weight(0), 1.0);
    // The numeric token is still consumed as a weight, not a label.
    EXPECT_FALSE(doc.edge_attributes.get(0, k_label_attribute_key).has_value());
}

TEST(EdgeListReaderTests, Labels_AfterOptionalWeight)
{
    EdgeListDocument doc = read("a b 3 heavy  road\nb c light road\n", false, true);

    EXPECT_DOUBLE_EQ(doc.graph.edge_weight(0), 3.0);
    EXPECT_EQ(*doc.edge_attributes.get(0, k_label_attribute_key), "heavy road");
    EXPECT_DOUBLE_EQ(doc.graph.edge_weight(1), 1.0);
    EXPECT_EQ(*doc.edge_attributes.get(1, k_label_attribute_key), "light road");
}

TEST(EdgeListReaderTests, Errors_NonFiniteWeightReportsLine)
{
    try
    {
        read("a b 1\n\nb c inf\n", false, true);
        FAIL() << "expected EdgeListError";
    }
    catch (const EdgeListError& e)
    {
        EXPECT_EQ(e.line(), 3u);
    }
}

TEST(EdgeListReaderTests, Errors_OverflowingWeightReportsLine)
{
    try
    {
        read("a b 1e999\n", false, true);
        FAIL() << "expected EdgeListError";
    }
    catch (const EdgeListError& e)
    {
        EXPECT_EQ(e.line(), 1u);
    }
}

TEST(EdgeListReaderTests, Labels_NonFiniteTokenIsLabelWhenUnweighted)
{
    EdgeListDocument doc = read("a b nan bread\nb c inf loop\nc a 1e999 big\n");

    EXPECT_EQ(doc.graph.edge_count(), 3u);
    EXPECT_EQ(*doc.edge_attributes.get(0, k_label_attribute_key), "nan bread");
    EXPECT_EQ(*doc.edge_attributes.get(1, k_label_attribute_key), "inf loop");
    EXPECT_EQ(*doc.edge_attributes.get(2, k_label_attribute_key), "1e999 big");
}

TEST(EdgeListReaderTests, Export_EndToEnd)
{
    EdgeListDocument doc = read("x y 0.5 link\n", true, true);

    GmlExporter<std::string, size_t> exporter;
    exporter.set_edge_attribute_lookup(doc.edge_attributes.lookup());
    exporter.set_parameter(GmlParameter::ExportVertexLabels, true);
    exporter.set_parameter(GmlParameter::ExportEdgeLabels, true);
    exporter.set_parameter(GmlParameter::ExportEdgeWeights, true);

    std::ostringstream out;
    exporter.export_graph(doc.graph, out);

    const std::string expected =
        "Creator \"JGraphT GML Exporter\"\n"
        "Version 1\n"
        "graph\n"
        "[\n"
        "\tlabel \"\"\n"
        "\tdirected 1\n"
        "\tnode\n\t[\n\t\tid 0\n\t\tlabel \"x\"\n\t]\n"
        "\tnode\n\t[\n\t\tid 1\n\t\tlabel \"y\"\n\t]\n"
        "\tedge\n\t[\n\t\tsource 0\n\t\ttarget 1\n\t\tlabel \"link\"\n\t\tweight 0.5\n\t]\n"
        "]\n";
    EXPECT_EQ(out.str(), expected);
}
