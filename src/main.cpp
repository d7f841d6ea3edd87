#include <secret_santa/assigner.hpp>
#include <secret_santa/config.hpp>
#include <secret_santa/errors.hpp>
#include <secret_santa/history.hpp>
#include <secret_santa/log.hpp>

#include <boost/program_options.hpp>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iostream>
#include <limits>
#include <random>
#include <string>

namespace
{

constexpr int exit_failure = 1;
constexpr int exit_configuration = 2;
constexpr int exit_infeasible = 3;
constexpr int exit_search_limit = 4;

// Notifier rejecting values outside [low, high]. Options are parsed as signed
// so that a negative value is not silently wrapped.
auto in_range(char const* option, long long low, long long high)
{
    return [=](long long value)
    {
        if (value < low || value > high)
        {
            throw boost::program_options::validation_error(
                boost::program_options::validation_error::invalid_option_value, option, std::to_string(value));
        }
    };
}

}

int main(int argc, char const* argv[])
{
    using secret_santa::log;
    using secret_santa::log_level;

    boost::program_options::options_description options("Usage: secret-santa [options] FILE");
    std::string input_file;
    std::string output_file;
    long long seed = 0;
    long long max_steps = static_cast<long long>(secret_santa::search_limits().max_steps);
    int lookback = secret_santa::all_years;
    int year = secret_santa::unknown_year;
    options.add_options()
       ("help,h", "Show this usage message")
       ("write-default", "Print a sample configuration and exit")
       ("input", boost::program_options::value<std::string>(&input_file), "Configuration file")
       ("output,o", boost::program_options::value<std::string>(&output_file), "Output file (default: standard output)")
       ("seed", boost::program_options::value<long long>(&seed)
            ->notifier(in_range("seed", 0, std::numeric_limits<std::uint32_t>::max())), "Random seed, for a reproducible assignment")
       ("max-steps", boost::program_options::value<long long>(&max_steps)->default_value(max_steps)
            ->notifier(in_range("max-steps", 0, std::numeric_limits<long long>::max())), "Search steps before giving up (0: no limit)")
       ("lookback", boost::program_options::value<int>(&lookback)->default_value(lookback), "Trailing history years to exclude (-1: all)")
       ("year", boost::program_options::value<int>(&year), "Year recorded with the assignment (default: this year)")
       ("dry-run,n", "Log each pair as well")
       ("verbose,v", "Log debug messages")
    ;

    boost::program_options::positional_options_description positional;
    positional.add("input", 1);

    boost::program_options::variables_map vm;
    try
    {
        boost::program_options::store(boost::program_options::command_line_parser(argc, argv).options(options).positional(positional).run(), vm);
        boost::program_options::notify(vm);
    }
    catch (boost::program_options::error const& e)
    {
        log(log_level::error, "{}", e.what());
        std::cerr << options << "\n";
        return exit_failure;
    }

    if (vm.count("help"))
    {
        std::cout << options << "\n";
        return 0;
    }

    if (vm.count("verbose"))
        secret_santa::set_log_level(log_level::debug);

    if (vm.count("write-default"))
    {
        secret_santa::write_model(std::cout, secret_santa::sample_model());
        return 0;
    }

    if (input_file.empty())
    {
        log(log_level::error, "No configuration file given.");
        std::cerr << options << "\n";
        return exit_failure;
    }

    if (!vm.count("year"))
    {
        year = secret_santa::calendar_year(std::time(nullptr));
        if (year == secret_santa::unknown_year)
        {
            log(log_level::error, "Cannot determine the current year; pass --year.");
            return exit_failure;
        }
    }

    secret_santa::search_limits limits;
    limits.max_steps = static_cast<std::size_t>(max_steps);

    try
    {
        auto model = secret_santa::read_model_file(input_file);
        model.history = secret_santa::select_active_history(model.history, lookback);

        secret_santa::assigner assigner(model);

        if (!vm.count("seed"))
            seed = std::random_device()();
        log(log_level::debug, "Using seed {}.", seed);
        secret_santa::random_engine random(static_cast<secret_santa::random_engine::result_type>(seed));

        auto const assignments = assigner.generate_valid_assignments(random, limits);

        if (vm.count("dry-run"))
        {
            for (auto const& pair : assignments)
            {
                log(log_level::info, "{} -> {}", pair.first, pair.second);
            }
        }

        if (output_file.empty())
        {
            secret_santa::write_assignments(std::cout, assignments, year);
        }
        else
        {
            std::ofstream output(output_file);
            if (!output)
            {
                log(log_level::error, "Failed opening '{}' for writing.", output_file);
                return exit_failure;
            }
            secret_santa::write_assignments(output, assignments, year);
        }

        log(log_level::info, "Assigned {} secret santas for {}.", assignments.size(), year);
    }
    catch (secret_santa::configuration_error const& e)
    {
        log(log_level::error, "Invalid configuration: {}", e.what());
        return exit_configuration;
    }
    catch (secret_santa::infeasible_error const& e)
    {
        log(log_level::error, "No secret santa solutions found: {}", e.what());
        return exit_infeasible;
    }
    catch (secret_santa::search_limit_error const& e)
    {
        log(log_level::error, "{}", e.what());
        return exit_search_limit;
    }
    catch (std::exception const& e)
    {
        log(log_level::error, "{}", e.what());
        return exit_failure;
    }

    return 0;
}
