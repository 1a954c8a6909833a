/**
 * @file edge_list_reader.hpp
 * @brief Reads the plain edge list format accepted by the gmlio_export tool.
 */
#pragma once
#include "gmlio/common/common.hpp"
#include "gmlio/graph/attribute_store.hpp"
#include "gmlio/graph/list_graph.hpp"

namespace gmlio
{

/**
 * @brief Graph type produced by the edge list reader.
 * @details Vertices are their names; edges are numbered from 0 in input order.
 */
using EdgeListGraph = ListGraph<std::string, size_t>;

/**
 * @brief Exception thrown on malformed edge list input.
 */
class EdgeListError : public std::runtime_error
{
public:
    EdgeListError(const std::string& message, size_t line)
        : std::runtime_error("line " + std::to_string(line) + ": " + message)
        , m_line(line)
    {
    }

    /**
     * @brief 1-based line number of the offending line, 0 for stream errors.
     */
    size_t line() const noexcept
    {
        return m_line;
    }

private:
    size_t m_line;
};

struct EdgeListOptions
{
    bool directed{false};
    bool weighted{false};
};

/**
 * @brief A graph read from an edge list together with its edge labels.
 *
 * @note `edge_attributes.lookup()` refers to this object; call it only once
 *       the document is at its final address.
 */
struct EdgeListDocument
{
    explicit EdgeListDocument(const EdgeListOptions& options)
        : graph(options.directed, options.weighted)
    {
    }

    EdgeListGraph graph;
    AttributeStore<size_t> edge_attributes;
};

/**
 * @brief Parse an edge list.
 *
 * @details
 * Line format, tokens separated by whitespace:
 * - blank lines and lines whose first token starts with `#` are skipped;
 * - `<vertex>` declares a vertex;
 * - `<source> <target> [weight] [label words...]` declares an edge, adding
 *   its endpoints first if needed. The third token is a weight if it parses
 *   completely as a finite number; the remaining tokens, joined by single
 *   spaces, become the edge's "label" attribute. A non-finite number
 *   (`nan`, `inf`, or a value that overflows such as `1e999`) is an error for
 *   weighted input and the start of the label otherwise.
 *
 * Vertices are added in order of first appearance. Weights are kept only if
 * `options.weighted` is set.
 *
 * @throw EdgeListError if a weight of weighted input is not finite, or the
 *        stream fails.
 */
EdgeListDocument read_edge_list(std::istream& in, const EdgeListOptions& options);

} // namespace gmlio
