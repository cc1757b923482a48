#ifndef MEDIATE_ERRORS_HPP
#define MEDIATE_ERRORS_HPP

#include <mediate/types.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediate
{

// Structured description of a signature that failed to classify.
// Returned as a value by try_classify(); carried by ConfigurationError.
struct ConfigurationFailure
{
    BindingContext context = BindingContext::None;
    std::string identity;
    std::string reason;

    // "Invalid mediator bound to an incoming channel: Bean#method - <reason>"
    std::string message() const;
};

// Base exception
class MediateError : public std::runtime_error
{
  public:
    explicit MediateError(const std::string& message) : std::runtime_error(message) {}
};

// Signature does not match any supported pattern for its deduced shape
class ConfigurationError : public MediateError
{
  public:
    explicit ConfigurationError(ConfigurationFailure failure)
        : MediateError(failure.message()), failure_(std::move(failure))
    {
    }

    ConfigurationError(BindingContext context, std::string identity, std::string reason)
        : ConfigurationError(
              ConfigurationFailure{context, std::move(identity), std::move(reason)})
    {
    }

    BindingContext context() const
    {
        return failure_.context;
    }

    const std::string& identity() const
    {
        return failure_.identity;
    }

    const std::string& reason() const
    {
        return failure_.reason;
    }

    const ConfigurationFailure& failure() const
    {
        return failure_;
    }

  private:
    ConfigurationFailure failure_;
};

// One or more mediators failed during the startup classification pass
class StartupError : public MediateError
{
  public:
    explicit StartupError(std::vector<ConfigurationFailure> failures);

    const std::vector<ConfigurationFailure>& failures() const
    {
        return failures_;
    }

  private:
    std::vector<ConfigurationFailure> failures_;
};

// JSON decode error
class JSONDecodeError : public MediateError
{
  public:
    explicit JSONDecodeError(const std::string& message) : MediateError(message) {}
};

// Manifest parse error
class ManifestParseError : public MediateError
{
  public:
    explicit ManifestParseError(const std::string& message)
        : MediateError(message), data_(nullptr) {}

    ManifestParseError(const std::string& message, const nlohmann::json& data)
        : MediateError(message), data_(std::make_shared<nlohmann::json>(data)) {}

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

} // namespace mediate

#endif // MEDIATE_ERRORS_HPP
