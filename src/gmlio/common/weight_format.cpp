/**
 * @file weight_format.cpp
 */
#include "gmlio/common/weight_format.hpp"

#include <charconv>
#include <cmath>

namespace gmlio
{

namespace
{

/// Large enough for any shortest round-trip double in either notation.
constexpr size_t k_buffer_size = 64;

std::string to_chars_string(double value, std::chars_format format)
{
    char buffer[k_buffer_size];
    auto result = std::to_chars(buffer, buffer + k_buffer_size, value, format);
    if (result.ec != std::errc())
    {
        throw std::runtime_error("Failed to format floating-point value");
    }
    return std::string(buffer, result.ptr);
}

std::string format_plain(double weight)
{
    std::string text = to_chars_string(weight, std::chars_format::fixed);
    if (text.find('.') == std::string::npos)
    {
        text += ".0";
    }
    return text;
}

std::string format_scientific(double weight)
{
    // to_chars gives e.g. "1e+07" or "1.25e-04".
    std::string text = to_chars_string(weight, std::chars_format::scientific);
    size_t e_pos = text.find('e');
    std::string mantissa = text.substr(0, e_pos);
    if (mantissa.find('.') == std::string::npos)
    {
        mantissa += ".0";
    }

    std::string exponent_digits = text.substr(e_pos + 1);
    bool negative_exponent = !exponent_digits.empty() && exponent_digits.front() == '-';
    if (!exponent_digits.empty() &&
        (exponent_digits.front() == '-' || exponent_digits.front() == '+'))
    {
        exponent_digits.erase(0, 1);
    }
    size_t first_nonzero = exponent_digits.find_first_not_of('0');
    exponent_digits = first_nonzero == std::string::npos
                          ? std::string("0")
                          : exponent_digits.substr(first_nonzero);

    return mantissa + "E" + (negative_exponent ? "-" : "") + exponent_digits;
}

} // namespace

std::string format_weight(double weight)
{
    if (std::isnan(weight))
    {
        return "NaN";
    }
    if (std::isinf(weight))
    {
        return weight > 0 ? "Infinity" : "-Infinity";
    }

    double magnitude = std::fabs(weight);
    if (magnitude == 0.0 || (magnitude >= 1e-3 && magnitude < 1e7))
    {
        return format_plain(weight);
    }
    return format_scientific(weight);
}

} // namespace gmlio
