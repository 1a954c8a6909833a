/**
 * @file display_string.hpp
 * @brief Default textual rendering of vertices and edges.
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Render a graph element as a human-readable string.
 *
 * @details
 * Used as the label of a vertex or edge that carries no "label" attribute.
 * String-like values are returned as-is; anything else is streamed through
 * `operator<<`.
 *
 * @tparam T The element type. Must be convertible to `std::string` or
 *         support `std::ostream& operator<<(std::ostream&, const T&)`.
 */
template <typename T>
std::string to_display_string(const T& value)
{
    if constexpr (std::is_convertible_v<const T&, std::string>)
    {
        return std::string(value);
    }
    else
    {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
}

} // namespace gmlio
