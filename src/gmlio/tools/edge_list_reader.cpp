/**
 * @file edge_list_reader.cpp
 */
#include "gmlio/tools/edge_list_reader.hpp"

#include <cmath>
#include <cstdlib>

namespace gmlio
{

namespace
{

std::vector<std::string> split_tokens(const std::string& line)
{
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<double> parse_number(const std::string& token)
{
    if (token.empty())
    {
        return std::nullopt;
    }
    // Overflow yields +/-HUGE_VAL (infinite) and underflow a finite tiny value,
    // so ERANGE needs no separate handling.
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size())
    {
        return std::nullopt;
    }
    return value;
}

std::string join_tokens(const std::vector<std::string>& tokens, size_t first)
{
    std::string result;
    for (size_t i = first; i < tokens.size(); ++i)
    {
        if (!result.empty())
        {
            result += ' ';
        }
        result += tokens[i];
    }
    return result;
}

} // namespace

EdgeListDocument read_edge_list(std::istream& in, const EdgeListOptions& options)
{
    EdgeListDocument document(options);

    std::string line;
    size_t line_number = 0;
    size_t next_edge = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        std::vector<std::string> tokens = split_tokens(line);
        if (tokens.empty() || tokens.front().front() == '#')
        {
            continue;
        }

        document.graph.add_vertex(tokens[0]);
        if (tokens.size() == 1)
        {
            continue;
        }
        document.graph.add_vertex(tokens[1]);

        double weight = k_default_edge_weight;
        size_t label_start = 2;
        if (tokens.size() > 2)
        {
            auto number = parse_number(tokens[2]);
            if (number && std::isfinite(*number))
            {
                weight = *number;
                label_start = 3;
            }
            else if (number && options.weighted)
            {
                throw EdgeListError("weight " + tokens[2] + " is not finite", line_number);
            }
        }

        size_t edge = next_edge++;
        document.graph.add_edge(edge, tokens[0], tokens[1], weight);

        std::string label = join_tokens(tokens, label_start);
        if (!label.empty())
        {
            document.edge_attributes.put(edge, k_label_attribute_key, std::move(label));
        }
    }

    if (in.bad())
    {
        throw EdgeListError("failed to read input", 0);
    }
    return document;
}

} // namespace gmlio
