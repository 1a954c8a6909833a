/**
 * @file identifier_assigner_tests.cpp
 * @brief Unit tests for IdentifierAssigner and IntegerIdProvider
 */
#include <gtest/gtest.h>
#include "gmlio/io/identifier_assigner.hpp"

using namespace gmlio;

// ============================================================================
// IntegerIdProvider
// ============================================================================

TEST(IntegerIdProviderTests, Sequence_FirstRequestOrder)
{
    IntegerIdProvider<std::string> provider;
    EXPECT_EQ(provider("b"), "0");
    EXPECT_EQ(provider("a"), "1");
    EXPECT_EQ(provider("c"), "2");
    EXPECT_EQ(provider.assigned_count(), 3u);
}

TEST(IntegerIdProviderTests, Sequence_RepeatedRequestIsStable)
{
    IntegerIdProvider<int> provider;
    EXPECT_EQ(provider(42), "0");
    EXPECT_EQ(provider(7), "1");
    EXPECT_EQ(provider(42), "0");
    EXPECT_EQ(provider.assigned_count(), 2u);
}

TEST(IntegerIdProviderTests, Sequence_CustomStart)
{
    IntegerIdProvider<int> provider(1);
    EXPECT_EQ(provider(10), "1");
    EXPECT_EQ(provider(20), "2");
}

TEST(IntegerIdProviderTests, Copies_ShareState)
{
    IntegerIdProvider<int> provider;
    IdProvider<int> wrapped = provider;
    EXPECT_EQ(wrapped(5), "0");
    EXPECT_EQ(provider(6), "1");
    EXPECT_EQ(wrapped(6), "1");
    EXPECT_EQ(provider.assigned_count(), 2u);
}

// ============================================================================
// IdentifierAssigner
// ============================================================================

TEST(IdentifierAssignerTests, VertexId_ProviderCalledOncePerVertex)
{
    std::vector<std::string> calls;
    IdProvider<std::string> vertex_provider = [&calls](const std::string& v) {
        calls.push_back(v);
        return "id_" + v;
    };
    std::optional<IdProvider<int>> edge_provider;

    IdentifierAssigner<std::string, int> ids(vertex_provider, edge_provider);
    EXPECT_EQ(ids.vertex_id("x"), "id_x");
    EXPECT_EQ(ids.vertex_id("y"), "id_y");
    EXPECT_EQ(ids.vertex_id("x"), "id_x");
    EXPECT_EQ(ids.vertex_id("y"), "id_y");

    EXPECT_EQ(calls, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(ids.assigned_count(), 2u);
}

TEST(IdentifierAssignerTests, VertexId_NonInjectiveProviderNotRejected)
{
    IdProvider<std::string> vertex_provider = [](const std::string&) { return "same"; };
    std::optional<IdProvider<int>> edge_provider;

    IdentifierAssigner<std::string, int> ids(vertex_provider, edge_provider);
    EXPECT_EQ(ids.vertex_id("a"), "same");
    EXPECT_EQ(ids.vertex_id("b"), "same");
    EXPECT_EQ(ids.assigned_count(), 2u);
}

TEST(IdentifierAssignerTests, EdgeId_AbsentWithoutProvider)
{
    IdProvider<std::string> vertex_provider = [](const std::string& v) { return v; };
    std::optional<IdProvider<int>> edge_provider;

    IdentifierAssigner<std::string, int> ids(vertex_provider, edge_provider);
    EXPECT_FALSE(ids.edge_id(3).has_value());
}

TEST(IdentifierAssignerTests, EdgeId_PresentWithProvider)
{
    IdProvider<std::string> vertex_provider = [](const std::string& v) { return v; };
    std::optional<IdProvider<int>> edge_provider =
        IdProvider<int>([](const int& e) { return std::to_string(e * 10); });

    IdentifierAssigner<std::string, int> ids(vertex_provider, edge_provider);
    auto id = ids.edge_id(3);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "30");
}
