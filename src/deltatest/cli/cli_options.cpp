/**
 * @file cli_options.cpp
 */
#include "deltatest/cli/cli_options.hpp"

#include "deltatest/common/errors.hpp"

#ifndef DELTATEST_VERSION
#define DELTATEST_VERSION "0.1.0"
#endif

namespace deltatest
{

namespace
{

/// Walks the argument list, splitting `--name=value` forms.
class ArgCursor
{
public:
    explicit ArgCursor(const std::vector<std::string>& args)
        : m_args(args)
    {
    }

    bool done() const noexcept
    {
        return m_pos >= m_args.size();
    }

    /// Advance to the next argument; returns the option name part.
    std::string next()
    {
        const std::string& arg = m_args[m_pos++];
        m_inline_value.reset();
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            size_t eq = arg.find('=');
            if (eq != std::string::npos)
            {
                m_inline_value = arg.substr(eq + 1);
                return arg.substr(0, eq);
            }
        }
        return arg;
    }

    std::string value(const std::string& option)
    {
        if (m_inline_value)
        {
            std::string result = *m_inline_value;
            m_inline_value.reset();
            return result;
        }
        if (done())
        {
            throw UsageError("option '" + option + "' requires a value");
        }
        return m_args[m_pos++];
    }

    void reject_value(const std::string& option) const
    {
        if (m_inline_value)
        {
            throw UsageError("option '" + option + "' does not take a value");
        }
    }

    std::vector<std::string> rest()
    {
        std::vector<std::string> result(m_args.begin() + static_cast<std::ptrdiff_t>(m_pos),
                                        m_args.end());
        m_pos = m_args.size();
        return result;
    }

private:
    const std::vector<std::string>& m_args;
    size_t m_pos{0};
    std::optional<std::string> m_inline_value;
};

void append_unit_list(const std::string& text, std::vector<UnitId>& units)
{
    size_t start = 0;
    while (start <= text.size())
    {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos)
        {
            comma = text.size();
        }
        std::string name = text.substr(start, comma - start);
        if (name.empty())
        {
            throw UsageError("empty crate name in '" + text + "'");
        }
        units.push_back(name);
        start = comma + 1;
    }
}

} // namespace

CliOptions parse_args(const std::vector<std::string>& args)
{
    CliOptions options;
    RunConfig& config = options.config;
    bool to_given = false;

    ArgCursor cursor(args);
    while (!cursor.done())
    {
        std::string arg = cursor.next();

        if (arg == "--")
        {
            config.passthrough_args = cursor.rest();
            break;
        }
        if (arg == "-h" || arg == "--help")
        {
            options.action = CliAction::Help;
            return options;
        }
        if (arg == "-V" || arg == "--version")
        {
            options.action = CliAction::Version;
            return options;
        }

        // Options with a value
        if (arg == "-C" || arg == "--directory")
        {
            config.start_directory = cursor.value(arg);
            continue;
        }
        if (arg == "--from")
        {
            config.from_ref = cursor.value(arg);
            continue;
        }
        if (arg == "--to")
        {
            config.to_ref = cursor.value(arg);
            to_given = true;
            continue;
        }
        if (arg == "-t" || arg == "--test-runner")
        {
            std::string name = cursor.value(arg);
            auto tool = parse_test_tool(name);
            if (!tool)
            {
                throw UsageError("unknown test runner '" + name + "' (expected cargo or nextest)");
            }
            config.tool = *tool;
            continue;
        }
        if (arg == "-p" || arg == "--crates")
        {
            append_unit_list(cursor.value(arg), config.override_units);
            continue;
        }
        if (arg == "--color")
        {
            std::string name = cursor.value(arg);
            auto mode = parse_color_mode(name);
            if (!mode)
            {
                throw UsageError("invalid color mode '" + name + "' (expected auto, always or never)");
            }
            config.color = *mode;
            continue;
        }
        if (arg == "--log-level")
        {
            std::string name = cursor.value(arg);
            auto level = parse_log_level(name);
            if (!level)
            {
                throw UsageError("invalid log level '" + name + "'");
            }
            config.log_level = *level;
            continue;
        }

        // Flags
        cursor.reject_value(arg);
        if (arg == "-s" || arg == "--skip-dependents")
        {
            config.skip_dependents = true;
        }
        else if (arg == "-n" || arg == "--dry-run")
        {
            config.dry_run = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            config.verbose = true;
        }
        else if (arg == "--fail-fast")
        {
            config.fail_fast = true;
        }
        else if (arg == "--no-fail-fast")
        {
            config.fail_fast = false;
        }
        else if (arg == "--json")
        {
            config.json = true;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            throw UsageError("unknown option '" + arg + "'");
        }
        else
        {
            throw UsageError("unexpected argument '" + arg +
                             "' (test runner arguments go after '--')");
        }
    }

    if (to_given && !config.from_ref)
    {
        throw UsageError("'--to' requires '--from'");
    }
    return options;
}

std::string help_text()
{
    return R"(Run tests only for crates affected by changes in the current workspace

Usage: deltatest [OPTIONS] [-- <TEST_RUNNER_ARGS>...]

Options:
  -C, --directory <DIR>     Directory used to discover the repository [default: .]
      --from <REF>          Compare <REF>..<TO> instead of uncommitted changes
      --to <REF>            End of the compared range [default: HEAD]; requires --from
  -t, --test-runner <TOOL>  Test runner: cargo or nextest [default: cargo]
  -s, --skip-dependents     Only test crates with changes, not their dependents
  -n, --dry-run             Print the crates that would be tested without testing them
  -v, --verbose             Display full test output while running
      --fail-fast           Stop at the first failing crate (default)
      --no-fail-fast        Test every crate regardless of failures
  -p, --crates <A,B,...>    Test exactly these crates, ignoring changes (repeatable)
      --json                Emit JSON lines instead of human-readable output
      --color <WHEN>        Color output: auto, always or never [default: auto]
      --log-level <LEVEL>   trace, debug, info, warn, error or off [default: warn]
  -h, --help                Print help
  -V, --version             Print version

Environment:
  DELTATEST_LOG             Log level when --log-level is not given
  NO_COLOR                  Disable color in auto mode

Exit status:
  0 success or dry run, 2 usage error, 20 tests failed, 30 repository not found,
  40 workspace metadata error, 50 git operation failed
)";
}

std::string version_text()
{
    return std::string("deltatest ") + DELTATEST_VERSION + "\n";
}

} // namespace deltatest
