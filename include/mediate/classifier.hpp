#ifndef MEDIATE_CLASSIFIER_HPP
#define MEDIATE_CLASSIFIER_HPP

#include <mediate/errors.hpp>
#include <mediate/mediator_configuration.hpp>
#include <mediate/signature.hpp>
#include <optional>
#include <variant>

namespace mediate
{

/// Either a validated configuration or the reason the signature was rejected
class ClassificationResult
{
  public:
    ClassificationResult(MediatorConfiguration configuration) : value_(std::move(configuration))
    {
    }

    ClassificationResult(ConfigurationFailure failure) : value_(std::move(failure)) {}

    bool ok() const
    {
        return std::holds_alternative<MediatorConfiguration>(value_);
    }

    explicit operator bool() const
    {
        return ok();
    }

    /// The configuration; throws ConfigurationError when classification failed
    const MediatorConfiguration& value() const
    {
        if (const auto* failure = std::get_if<ConfigurationFailure>(&value_))
            throw ConfigurationError(*failure);
        return std::get<MediatorConfiguration>(value_);
    }

    /// The failure, or nullptr on success
    const ConfigurationFailure* error() const
    {
        return std::get_if<ConfigurationFailure>(&value_);
    }

  private:
    std::variant<MediatorConfiguration, ConfigurationFailure> value_;
};

/// Shape implied by the declared bindings and, when both are present, by the
/// stream-ness of the return type and first parameter.
/// With neither binding this returns Shape::Publisher; try_classify() rejects
/// that case before deducing anything.
Shape deduce_shape(const Signature& signature, bool has_incoming, bool has_outgoing);

/// Classify @p signature without throwing for signature defects
ClassificationResult try_classify(const Signature& signature,
                                  const std::optional<ChannelBinding>& incoming,
                                  const std::optional<ChannelBinding>& outgoing);

/// Classify @p signature, throwing ConfigurationError when it matches no
/// supported pattern for its deduced shape
MediatorConfiguration classify(const Signature& signature,
                               const std::optional<ChannelBinding>& incoming,
                               const std::optional<ChannelBinding>& outgoing);

} // namespace mediate

#endif // MEDIATE_CLASSIFIER_HPP
