/**
 * @file cli_options.hpp
 * @brief Command-line options and the RunConfig they produce.
 */
#pragma once
#include "deltatest/common/common.hpp"
#include "deltatest/common/log.hpp"
#include "deltatest/common/unit_types.hpp"
#include "deltatest/reporting/text_style.hpp"

namespace deltatest
{

/**
 * @brief Configuration for one invocation.
 */
struct RunConfig
{
    /**
     * @brief Directory used to discover the repository.
     */
    std::filesystem::path start_directory{"."};

    /**
     * @brief Compare `from_ref..to_ref` instead of uncommitted changes.
     */
    std::optional<std::string> from_ref;

    /**
     * @brief End of the compared range; only used with `from_ref`.
     */
    std::string to_ref{"HEAD"};

    TestTool tool{TestTool::Cargo};

    /**
     * @brief Test only the directly changed units.
     */
    bool skip_dependents{false};

    bool dry_run{false};

    /**
     * @brief Stream test output while it is produced.
     */
    bool verbose{false};

    bool fail_fast{true};

    /**
     * @brief Explicit units to test; non-empty selects override mode.
     */
    std::vector<UnitId> override_units;

    /**
     * @brief Emit JSON-lines events instead of human-readable text.
     */
    bool json{false};

    ColorMode color{ColorMode::Auto};

    /**
     * @brief Log level from the command line; unset falls back to the
     *        `DELTATEST_LOG` environment variable.
     */
    std::optional<LogLevel> log_level;

    /**
     * @brief Arguments after `--`, passed to the test tool verbatim.
     */
    std::vector<std::string> passthrough_args;
};

enum class CliAction
{
    Run,
    Help,
    Version
};

struct CliOptions
{
    CliAction action{CliAction::Run};
    RunConfig config;
};

/**
 * @brief Parse command-line arguments (without the program name).
 *
 * @details
 * Options accept their value as the next argument or after `=`
 * (`--from main`, `--from=main`). Everything after the first `--` is
 * passthrough.
 *
 * @throw UsageError on an unknown option, a missing or invalid value, or
 *        `--to` without `--from`.
 */
CliOptions parse_args(const std::vector<std::string>& args);

std::string help_text();

std::string version_text();

} // namespace deltatest
