/**
 * @file export_exceptions.hpp
 */
#pragma once
#include "gmlio/common/common.hpp"

namespace gmlio
{

/**
 * @brief Error codes for exporter operations.
 */
enum class ExportErrorCode
{
    /// A required collaborator (e.g. the vertex id provider) was empty.
    InvalidArgument,
    /// Writing to or opening the output destination failed.
    SinkFailure
};

/**
 * @brief Exception class for exporter errors.
 *
 * @details
 * `ExportError` is thrown when an exporter is configured with an unusable
 * collaborator, or when its output sink fails. A sink failure aborts the
 * export immediately; whatever was written before the failure is left in the
 * destination as a truncated document.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class ExportError : public std::exception
{
public:
    /**
     * @brief Construct an ExportError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    ExportError(ExportErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ExportErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ExportErrorCode m_code;
    std::string m_message;
};

} // namespace gmlio
