#include <mediate/registry.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace mediate
{

MediatorRegistry::MediatorRegistry(RegistryOptions options) : options_(std::move(options)) {}

void MediatorRegistry::add(Signature signature, std::optional<ChannelBinding> incoming,
                           std::optional<ChannelBinding> outgoing)
{
    if (contains(signature.identity))
        throw std::invalid_argument("Duplicate mediator: " + signature.identity);

    // Not a mediator at all; refuse it here instead of classifying it as a publisher
    if (!incoming.has_value() && !outgoing.has_value())
    {
        throw ConfigurationError(BindingContext::None, signature.identity,
                                 "the method is not bound to any channel");
    }

    entries_.push_back(Entry{std::move(signature), std::move(incoming), std::move(outgoing)});
    configurations_.clear();
    classified_ = false;
}

const std::vector<MediatorConfiguration>& MediatorRegistry::classify_all()
{
    std::vector<MediatorConfiguration> configurations;
    std::vector<ConfigurationFailure> failures;
    configurations.reserve(entries_.size());

    for (const auto& entry : entries_)
    {
        ClassificationResult result = try_classify(entry.signature, entry.incoming, entry.outgoing);
        if (const ConfigurationFailure* failure = result.error())
        {
            log(failure->message());
            failures.push_back(*failure);
            if (options_.fail_fast)
                break;
            continue;
        }

        const MediatorConfiguration& config = result.value();
        if (options_.verbose)
        {
            log(config.method_as_string() + ": " + to_string(config.shape()) + " (consumes " +
                to_string(config.consumption()) + ", produces " +
                to_string(config.production()) +
                (config.uses_builder_types() ? ", builder types)" : ")"));
        }
        configurations.push_back(config);
    }

    if (!failures.empty())
        throw StartupError(std::move(failures));

    configurations_ = std::move(configurations);
    classified_ = true;
    return configurations_;
}

const MediatorConfiguration* MediatorRegistry::find(const std::string& identity) const
{
    auto it = std::find_if(configurations_.begin(), configurations_.end(),
                           [&identity](const MediatorConfiguration& config)
                           { return config.method_as_string() == identity; });
    if (it == configurations_.end())
        return nullptr;
    return &*it;
}

bool MediatorRegistry::contains(const std::string& identity) const
{
    return std::any_of(entries_.begin(), entries_.end(),
                       [&identity](const Entry& entry)
                       { return entry.signature.identity == identity; });
}

void MediatorRegistry::log(const std::string& line) const
{
    if (options_.diagnostic_callback.has_value() && *options_.diagnostic_callback)
    {
        (*options_.diagnostic_callback)("[mediate] " + line);
        return;
    }
    std::cerr << "[mediate] " << line << std::endl;
}

} // namespace mediate
