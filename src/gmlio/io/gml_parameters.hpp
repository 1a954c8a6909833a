/**
 * @file gml_parameters.hpp
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Flags that change the shape of a GML export.
 */
enum class GmlParameter
{
    /// Write edge labels, taken from the edge attribute "label".
    ExportEdgeLabels,
    /// Write vertex labels, taken from the vertex attribute "label".
    ExportVertexLabels,
    /// Write edge weights. Has no effect on unweighted graphs.
    ExportEdgeWeights,
    /// Escape quoted strings; otherwise they are written verbatim.
    EscapeStringsAsText
};

/**
 * @brief Number of `GmlParameter` values.
 */
inline constexpr size_t k_gml_parameter_count = 4;

/**
 * @brief Name of a parameter, for logs and messages.
 */
const char* to_string(GmlParameter parameter) noexcept;

/**
 * @brief A set of enabled `GmlParameter` flags.
 *
 * @details
 * Plain value type; every flag starts cleared and may be set or cleared any
 * number of times, the last write wins. Flags are independent of each other.
 */
class GmlParameters
{
public:
    GmlParameters() = default;

    bool is_set(GmlParameter parameter) const;

    void set(GmlParameter parameter, bool value);

    /**
     * @brief Comma separated names of the enabled flags, or "none".
     */
    std::string describe() const;

    bool operator==(const GmlParameters& other) const noexcept
    {
        return m_flags == other.m_flags;
    }

    bool operator!=(const GmlParameters& other) const noexcept
    {
        return !(*this == other);
    }

private:
    std::bitset<k_gml_parameter_count> m_flags;
};

} // namespace gmlio
