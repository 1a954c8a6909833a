/**
 * @file weight_format.hpp
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Format an edge weight the way GML consumers expect a real number.
 *
 * @details
 * Produces the shortest digit string that reads back to the same `double`.
 * - Zero and magnitudes in [1e-3, 1e7) use plain decimal notation with at
 *   least one digit after the point: `2.5`, `1.0`, `0.001`, `-0.0`.
 * - Other finite values use `<mantissa>E<exponent>` with a mantissa in
 *   [1, 10) that always has a fractional digit: `1.0E7`, `1.25E-4`.
 * - Non-finite values are `NaN`, `Infinity` and `-Infinity`.
 */
std::string format_weight(double weight);

} // namespace gmlio
