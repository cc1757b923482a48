#include <mediate/mediator_configuration.hpp>
#include <stdexcept>
#include <utility>

namespace mediate
{

MediatorConfiguration::MediatorConfiguration(Signature signature, Shape shape,
                                             Production production, Consumption consumption,
                                             bool uses_builder_types,
                                             std::optional<ChannelBinding> incoming,
                                             std::optional<ChannelBinding> outgoing)
    : signature_(std::move(signature)), shape_(shape), production_(production),
      consumption_(consumption), uses_builder_types_(uses_builder_types),
      incoming_(std::move(incoming)), outgoing_(std::move(outgoing))
{
    if ((production_ == Production::None) != (shape_ == Shape::Subscriber))
    {
        throw std::invalid_argument("Inconsistent configuration for " + signature_.identity +
                                    ": production " + to_string(production_) +
                                    " with shape " + to_string(shape_));
    }
    if ((consumption_ == Consumption::None) != (shape_ == Shape::Publisher))
    {
        throw std::invalid_argument("Inconsistent configuration for " + signature_.identity +
                                    ": consumption " + to_string(consumption_) +
                                    " with shape " + to_string(shape_));
    }
}

std::optional<std::string> MediatorConfiguration::incoming() const
{
    if (!incoming_.has_value())
        return std::nullopt;
    return incoming_->channel;
}

std::optional<std::string> MediatorConfiguration::outgoing() const
{
    if (!outgoing_.has_value())
        return std::nullopt;
    return outgoing_->channel;
}

std::optional<std::string> MediatorConfiguration::incoming_provider() const
{
    if (!incoming_.has_value())
        return std::nullopt;
    return incoming_->provider;
}

std::optional<std::string> MediatorConfiguration::outgoing_provider() const
{
    if (!outgoing_.has_value())
        return std::nullopt;
    return outgoing_->provider;
}

json MediatorConfiguration::to_json() const
{
    json result = {{"method", signature_.identity},
                   {"shape", to_string(shape_)},
                   {"production", to_string(production_)},
                   {"consumption", to_string(consumption_)},
                   {"usesBuilderTypes", uses_builder_types_}};

    // Unbound sides are reported as null
    result["incoming"] = incoming_.has_value() ? incoming_->to_json() : json(nullptr);
    result["outgoing"] = outgoing_.has_value() ? outgoing_->to_json() : json(nullptr);
    return result;
}

bool MediatorConfiguration::operator==(const MediatorConfiguration& other) const
{
    return signature_ == other.signature_ && shape_ == other.shape_ &&
           production_ == other.production_ && consumption_ == other.consumption_ &&
           uses_builder_types_ == other.uses_builder_types_ && incoming_ == other.incoming_ &&
           outgoing_ == other.outgoing_;
}

} // namespace mediate
