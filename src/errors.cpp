#include <mediate/errors.hpp>
#include <sstream>

namespace mediate
{

namespace
{

std::string summarize(const std::vector<ConfigurationFailure>& failures)
{
    std::ostringstream oss;
    oss << failures.size() << (failures.size() == 1 ? " mediator" : " mediators")
        << " failed to classify";
    for (const auto& failure : failures)
        oss << "\n  " << failure.message();
    return oss.str();
}

} // namespace

std::string ConfigurationFailure::message() const
{
    return "Invalid mediator bound to " + std::string(to_string(context)) + ": " + identity +
           " - " + reason;
}

StartupError::StartupError(std::vector<ConfigurationFailure> failures)
    : MediateError(summarize(failures)), failures_(std::move(failures))
{
}

} // namespace mediate
