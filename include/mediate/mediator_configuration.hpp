#ifndef MEDIATE_MEDIATOR_CONFIGURATION_HPP
#define MEDIATE_MEDIATOR_CONFIGURATION_HPP

#include <mediate/signature.hpp>
#include <mediate/types.hpp>
#include <optional>
#include <string>

namespace mediate
{

/// Validated outcome of classifying one mediator signature.
///
/// Read-only once constructed: the stream wiring runtime consults it on every
/// invocation to decide whether to wrap or unwrap the envelope, whether to
/// adapt an asynchronous single value or a stream, and whether to bridge the
/// builder wrapper types.
///
/// Invariants (checked on construction):
/// - production() == Production::None iff shape() == Shape::Subscriber
/// - consumption() == Consumption::None iff shape() == Shape::Publisher
class MediatorConfiguration
{
  public:
    MediatorConfiguration(Signature signature, Shape shape, Production production,
                          Consumption consumption, bool uses_builder_types,
                          std::optional<ChannelBinding> incoming,
                          std::optional<ChannelBinding> outgoing);

    Shape shape() const
    {
        return shape_;
    }

    Production production() const
    {
        return production_;
    }

    Consumption consumption() const
    {
        return consumption_;
    }

    bool uses_builder_types() const
    {
        return uses_builder_types_;
    }

    /// Incoming channel name, if bound
    std::optional<std::string> incoming() const;

    /// Outgoing channel name, if bound
    std::optional<std::string> outgoing() const;

    std::optional<std::string> incoming_provider() const;
    std::optional<std::string> outgoing_provider() const;

    const std::optional<ChannelBinding>& incoming_binding() const
    {
        return incoming_;
    }

    const std::optional<ChannelBinding>& outgoing_binding() const
    {
        return outgoing_;
    }

    const Signature& signature() const
    {
        return signature_;
    }

    /// Diagnostic identity of the classified method
    const std::string& method_as_string() const
    {
        return signature_.identity;
    }

    json to_json() const;

    bool operator==(const MediatorConfiguration& other) const;
    bool operator!=(const MediatorConfiguration& other) const
    {
        return !(*this == other);
    }

  private:
    Signature signature_;
    Shape shape_;
    Production production_;
    Consumption consumption_;
    bool uses_builder_types_;
    std::optional<ChannelBinding> incoming_;
    std::optional<ChannelBinding> outgoing_;
};

} // namespace mediate

#endif // MEDIATE_MEDIATOR_CONFIGURATION_HPP
