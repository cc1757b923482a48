#ifndef MEDIATE_TOOLS_INSPECT_HPP
#define MEDIATE_TOOLS_INSPECT_HPP

#include <ostream>
#include <string>
#include <vector>

namespace mediate
{
namespace tools
{

/// Exit codes of mediate-inspect
enum InspectExitCode
{
    InspectOk = 0,
    InspectClassificationFailed = 1,
    InspectUsageError = 2
};

/// Run mediate-inspect over @p args (without the program name).
/// Results go to @p out; diagnostics and errors to @p err.
int run_inspect(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
                bool color = true);

} // namespace tools
} // namespace mediate

#endif // MEDIATE_TOOLS_INSPECT_HPP
