/**
 * @file gml_parameters_tests.cpp
 */
#include <gtest/gtest.h>
#include "gmlio/io/gml_parameters.hpp"

using namespace gmlio;

namespace
{

const GmlParameter k_all_parameters[] = {
    GmlParameter::ExportEdgeLabels,
    GmlParameter::ExportVertexLabels,
    GmlParameter::ExportEdgeWeights,
    GmlParameter::EscapeStringsAsText,
};

} // namespace

TEST(GmlParametersTests, Default_AllCleared)
{
    GmlParameters params;
    for (auto p : k_all_parameters)
    {
        EXPECT_FALSE(params.is_set(p)) << to_string(p);
    }
    EXPECT_EQ(params.describe(), "none");
}

TEST(GmlParametersTests, Set_FlagsAreIndependent)
{
    for (auto target : k_all_parameters)
    {
        GmlParameters params;
        params.set(target, true);
        for (auto p : k_all_parameters)
        {
            EXPECT_EQ(params.is_set(p), p == target) << to_string(p);
        }
    }
}

TEST(GmlParametersTests, Set_LastWriteWins)
{
    GmlParameters params;
    params.set(GmlParameter::ExportEdgeWeights, true);
    params.set(GmlParameter::ExportEdgeWeights, true);
    EXPECT_TRUE(params.is_set(GmlParameter::ExportEdgeWeights));
    params.set(GmlParameter::ExportEdgeWeights, false);
    EXPECT_FALSE(params.is_set(GmlParameter::ExportEdgeWeights));
    params.set(GmlParameter::ExportEdgeWeights, true);
    EXPECT_TRUE(params.is_set(GmlParameter::ExportEdgeWeights));
}

TEST(GmlParametersTests, Describe_ListsEnabledFlags)
{
    GmlParameters params;
    params.set(GmlParameter::EscapeStringsAsText, true);
    params.set(GmlParameter::ExportVertexLabels, true);
    EXPECT_EQ(params.describe(), "ExportVertexLabels,EscapeStringsAsText");
}

TEST(GmlParametersTests, Equality_ComparesFlags)
{
    GmlParameters a;
    GmlParameters b;
    EXPECT_EQ(a, b);
    a.set(GmlParameter::ExportEdgeLabels, true);
    EXPECT_NE(a, b);
    b.set(GmlParameter::ExportEdgeLabels, true);
    EXPECT_EQ(a, b);
}
