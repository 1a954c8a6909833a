/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Error codes for ListGraph operations.
 */
enum class GraphErrorCode
{
    UnknownVertex,
    DuplicateEdge,
    UnknownEdge,
    UnsupportedOperation
};

/**
 * @brief Exception class for graph container errors.
 *
 * @details
 * `GraphError` is thrown by `ListGraph` methods when an operation refers to a
 * vertex or edge that is not in the graph, would insert an edge value twice,
 * or is not supported by the graph's type (e.g. setting a weight on an
 * unweighted graph). Each exception carries an error code and a message.
 */
class GraphError : public std::exception
{
public:
    GraphError(GraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GraphErrorCode m_code;
    std::string m_message;
};

} // namespace gmlio
