/**
 * @file errors.hpp
 */
#pragma once
#include "deltatest/common/common.hpp"

namespace deltatest
{

class GraphDiagnostics;

/**
 * @brief Process exit codes used by the command-line tool.
 *
 * @details
 * `Success` is also used for a dry run and for "nothing to test".
 */
enum class ExitCode : int
{
    Success = 0,
    Unexpected = 1,
    Usage = 2,
    TestsFailed = 20,
    RepositoryNotFound = 30,
    Metadata = 40,
    VcsOperation = 50
};

/**
 * @brief Base class for all errors raised by deltatest.
 *
 * @details
 * Each concrete error carries its own code enumeration and maps itself to
 * the exit code the command-line tool terminates with when the error is
 * fatal.
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message)
    {
    }

    /**
     * @brief Exit code used when this error terminates the run.
     */
    virtual ExitCode exit_code() const noexcept
    {
        return ExitCode::Unexpected;
    }
};

// ============================================================================
// GraphError
// ============================================================================

/**
 * @brief Error codes for UnitGraph and workspace metadata failures.
 */
enum class GraphErrorCode
{
    UnknownDependency,
    UnknownUnit,
    DuplicateUnit,
    InvalidUnit,
    MetadataUnavailable
};

/**
 * @brief Malformed workspace metadata or an invalid unit identifier.
 *
 * @details
 * `GraphError` is fatal: it is raised before any test command executes.
 * When it originates from `UnitGraph::build()` it also carries the full
 * diagnostics, so callers can inspect every problem rather than only the
 * message text.
 */
class GraphError : public Error
{
public:
    GraphError(GraphErrorCode code,
               const std::string& message,
               std::shared_ptr<const GraphDiagnostics> diagnostics = nullptr)
        : Error(message)
        , m_code(code)
        , m_diagnostics(std::move(diagnostics))
    {
    }

    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Diagnostics that caused the error, or nullptr if not available.
     */
    const std::shared_ptr<const GraphDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    ExitCode exit_code() const noexcept override
    {
        return ExitCode::Metadata;
    }

private:
    GraphErrorCode m_code;
    std::shared_ptr<const GraphDiagnostics> m_diagnostics;
};

// ============================================================================
// DiffError
// ============================================================================

/**
 * @brief Error codes for the version-control diff provider.
 */
enum class DiffErrorCode
{
    RepositoryNotFound,
    InvalidReference,
    CommandFailed,
    MalformedOutput
};

/**
 * @brief The changed-file list could not be produced.
 */
class DiffError : public Error
{
public:
    DiffError(DiffErrorCode code, const std::string& message)
        : Error(message)
        , m_code(code)
    {
    }

    DiffErrorCode code() const noexcept
    {
        return m_code;
    }

    ExitCode exit_code() const noexcept override
    {
        return m_code == DiffErrorCode::RepositoryNotFound ? ExitCode::RepositoryNotFound
                                                           : ExitCode::VcsOperation;
    }

private:
    DiffErrorCode m_code;
};

// ============================================================================
// InvocationError
// ============================================================================

/**
 * @brief Error codes for external process invocation.
 */
enum class InvocationErrorCode
{
    SpawnFailed,
    ExecFailed,
    IoFailed
};

/**
 * @brief An external command could not be started or its output not read.
 *
 * @details
 * During a test run this error never escapes the orchestrator: it becomes a
 * `Failed` outcome for the unit being tested.
 */
class InvocationError : public Error
{
public:
    InvocationError(InvocationErrorCode code, const std::string& message)
        : Error(message)
        , m_code(code)
    {
    }

    InvocationErrorCode code() const noexcept
    {
        return m_code;
    }

private:
    InvocationErrorCode m_code;
};

// ============================================================================
// UsageError
// ============================================================================

/**
 * @brief Invalid command-line usage.
 */
class UsageError : public Error
{
public:
    explicit UsageError(const std::string& message)
        : Error(message)
    {
    }

    ExitCode exit_code() const noexcept override
    {
        return ExitCode::Usage;
    }
};

} // namespace deltatest
