/**
 * inspect.cpp - Manifest Classification Tool
 *
 * Loads a JSON signature manifest, registers every declared mediator and runs
 * the startup classification pass over them. Prints one line per mediator, or
 * the configurations as JSON with --json.
 *
 * Usage: mediate-inspect <manifest.json> [--json] [--verbose]
 *
 * Exit codes:
 *   0 - every mediator classified
 *   1 - one or more mediators failed to classify, or a declaration is unbound
 *   2 - usage error, duplicate identity, unreadable or malformed manifest
 */

#include "inspect.hpp"

#include <mediate/mediate.hpp>

#include <iomanip>
#include <stdexcept>

namespace mediate
{
namespace tools
{

namespace
{

// ============================================================================
// ANSI Color Codes for Terminal Output
// ============================================================================

struct Palette
{
    const char* reset = "\033[0m";
    const char* red = "\033[31m";
    const char* green = "\033[32m";
    const char* yellow = "\033[33m";
    const char* bold = "\033[1m";
};

Palette make_palette(bool color)
{
    if (color)
        return Palette{};
    return Palette{"", "", "", "", ""};
}

struct InspectOptions
{
    std::string manifest_path;
    bool json_output = false;
    bool verbose = false;
};

void print_usage(std::ostream& out)
{
    out << "Usage: mediate-inspect <manifest.json> [--json] [--verbose]\n"
        << "  --json     print the classified configurations as JSON\n"
        << "  --verbose  log every classification decision\n";
}

// Returns false on a usage error
bool parse_arguments(const std::vector<std::string>& args, InspectOptions& options)
{
    for (const auto& arg : args)
    {
        if (arg == "--json")
            options.json_output = true;
        else if (arg == "--verbose")
            options.verbose = true;
        else if (!arg.empty() && arg[0] == '-')
            return false;
        else if (options.manifest_path.empty())
            options.manifest_path = arg;
        else
            return false;
    }
    return !options.manifest_path.empty();
}

void print_table(const std::vector<MediatorConfiguration>& configs, const Palette& color,
                 std::ostream& out)
{
    for (const auto& config : configs)
    {
        out << color.green << std::left << std::setw(20) << to_string(config.shape())
            << color.reset << config.method_as_string() << "\n"
            << "    consumes " << to_string(config.consumption()) << ", produces "
            << to_string(config.production());
        if (config.uses_builder_types())
            out << " (builder types)";
        if (config.incoming())
            out << "\n    in:  " << *config.incoming();
        if (config.outgoing())
            out << "\n    out: " << *config.outgoing();
        out << "\n";
    }
}

} // namespace

int run_inspect(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
                bool color)
{
    const Palette palette = make_palette(color);

    InspectOptions options;
    if (!parse_arguments(args, options))
    {
        print_usage(err);
        return InspectUsageError;
    }

    RegistryOptions registry_options;
    registry_options.verbose = options.verbose;
    registry_options.diagnostic_callback = [&err, &palette](const std::string& line)
    { err << palette.yellow << line << palette.reset << "\n"; };

    MediatorRegistry registry(registry_options);

    try
    {
        register_manifest(registry, load_manifest(options.manifest_path));
    }
    catch (const JSONDecodeError& e)
    {
        err << palette.red << "Malformed manifest: " << e.what() << palette.reset << "\n";
        return InspectUsageError;
    }
    catch (const ManifestParseError& e)
    {
        err << palette.red << e.what() << palette.reset << "\n";
        if (e.data() != nullptr)
            err << "  in: " << e.data()->dump() << "\n";
        return InspectUsageError;
    }
    catch (const ConfigurationError& e)
    {
        // Unbound declaration
        err << palette.red << e.what() << palette.reset << "\n";
        return InspectClassificationFailed;
    }
    catch (const std::invalid_argument& e)
    {
        // Duplicate identity
        err << palette.red << e.what() << palette.reset << "\n";
        return InspectUsageError;
    }

    try
    {
        const auto& configs = registry.classify_all();

        if (options.json_output)
        {
            json result = json::array();
            for (const auto& config : configs)
                result.push_back(config.to_json());
            out << result.dump(2) << "\n";
        }
        else
        {
            out << palette.bold << configs.size() << " mediator(s) classified" << palette.reset
                << "\n";
            print_table(configs, palette, out);
        }
    }
    catch (const StartupError& e)
    {
        // Each failure was already logged through the diagnostic callback
        err << palette.red << e.failures().size() << " mediator(s) failed to classify"
            << palette.reset << "\n";
        return InspectClassificationFailed;
    }

    return InspectOk;
}

} // namespace tools
} // namespace mediate
