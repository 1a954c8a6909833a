/**
 * @file gml_parameters.cpp
 */
#include "gmlio/io/gml_parameters.hpp"

namespace gmlio
{

const char* to_string(GmlParameter parameter) noexcept
{
    switch (parameter)
    {
    case GmlParameter::ExportEdgeLabels:
        return "ExportEdgeLabels";
    case GmlParameter::ExportVertexLabels:
        return "ExportVertexLabels";
    case GmlParameter::ExportEdgeWeights:
        return "ExportEdgeWeights";
    case GmlParameter::EscapeStringsAsText:
        return "EscapeStringsAsText";
    }
    return "Unknown";
}

bool GmlParameters::is_set(GmlParameter parameter) const
{
    return m_flags.test(static_cast<size_t>(parameter));
}

void GmlParameters::set(GmlParameter parameter, bool value)
{
    m_flags.set(static_cast<size_t>(parameter), value);
}

std::string GmlParameters::describe() const
{
    static const GmlParameter all[] = {
        GmlParameter::ExportEdgeLabels,
        GmlParameter::ExportVertexLabels,
        GmlParameter::ExportEdgeWeights,
        GmlParameter::EscapeStringsAsText,
    };

    std::string result;
    for (GmlParameter parameter : all)
    {
        if (!is_set(parameter))
        {
            continue;
        }
        if (!result.empty())
        {
            result += ",";
        }
        result += to_string(parameter);
    }
    return result.empty() ? "none" : result;
}

} // namespace gmlio
