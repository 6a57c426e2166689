#include "deltatest/app/app.hpp"
#include "deltatest/cli/cli_options.hpp"
#include "deltatest/common/log.hpp"
#include "deltatest/execution/test_invoker.hpp"
#include "deltatest/reporting/console_reporter.hpp"
#include "deltatest/reporting/json_reporter.hpp"
#include "deltatest/vcs/git_vcs.hpp"
#include "deltatest/workspace/cargo_metadata.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace
{

void apply_log_level(const deltatest::RunConfig& config)
{
    using namespace deltatest;
    if (config.log_level)
    {
        Logger::instance().set_level(*config.log_level);
        return;
    }
    const char* env = std::getenv("DELTATEST_LOG");
    if (env != nullptr && *env != '\0')
    {
        auto level = parse_log_level(env);
        if (level)
        {
            Logger::instance().set_level(*level);
        }
        else
        {
            DELTATEST_LOG_WARN("app", "ignoring invalid DELTATEST_LOG value '" << env << "'");
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    using namespace deltatest;
    try
    {
        CliOptions options = parse_args(std::vector<std::string>(argv + 1, argv + argc));
        if (options.action == CliAction::Help)
        {
            std::cout << help_text() << std::flush;
            return EXIT_SUCCESS;
        }
        if (options.action == CliAction::Version)
        {
            std::cout << version_text() << std::flush;
            return EXIT_SUCCESS;
        }

        const RunConfig& config = options.config;
        apply_log_level(config);

        std::unique_ptr<IReporter> reporter;
        if (config.json)
        {
            reporter = std::make_unique<JsonReporter>(std::cout, config.verbose);
        }
        else
        {
            TextStyle style(should_use_color(config.color, STDOUT_FILENO));
            reporter = std::make_unique<ConsoleReporter>(std::cout, std::cerr, style, config.verbose);
        }

        GitVcs vcs;
        CargoWorkspace workspace;

        // The invoker needs the workspace root, which is only known once the
        // repository has been found.
        std::filesystem::path root;
        try
        {
            root = vcs.workspace_root(config.start_directory);
        }
        catch (const Error& e)
        {
            reporter->error(e.what());
            if (auto tip = tip_for(e))
            {
                reporter->tip(*tip);
            }
            return static_cast<int>(e.exit_code());
        }

        CommandTestInvoker invoker(config.tool, root);
        App app(vcs, workspace, invoker, *reporter, [&invoker]() -> std::optional<std::string> {
            if (invoker.is_available())
            {
                return std::nullopt;
            }
            return invoker.installation_tip();
        });

        RunConfig effective = config;
        effective.start_directory = root;
        ExitCode code = app.run(effective);
        std::cout << std::flush;
        return static_cast<int>(code);
    }
    catch (const UsageError& e)
    {
        std::cerr << "error: " << e.what() << "\n"
                  << "  tip: run 'deltatest --help' for usage\n"
                  << std::flush;
        return static_cast<int>(e.exit_code());
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << "\n" << std::flush;
        return static_cast<int>(ExitCode::Unexpected);
    }
}
