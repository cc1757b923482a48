#ifndef MEDIATE_TYPES_HPP
#define MEDIATE_TYPES_HPP

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace mediate
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Classification Enumerations
// ============================================================================

/// Structural category of a mediator's channel participation
enum class Shape
{
    Subscriber,       // Sink: consumes only
    Publisher,        // Source: produces only
    Processor,        // Consumes one item, produces a stream or a single item
    StreamTransformer // Maps a whole stream to another stream
};

/// What a single invocation produces and how
enum class Production
{
    None,
    IndividualPayload,
    IndividualMessage,
    CompletionStageOfPayload,
    CompletionStageOfMessage,
    StreamOfPayload,
    StreamOfMessage
};

/// What a single invocation consumes and how
/// There is no asynchronous single value variant: it is not a supported input.
enum class Consumption
{
    None,
    Payload,
    Message,
    StreamOfPayload,
    StreamOfMessage
};

/// Which channel bindings were declared when a configuration error was raised
enum class BindingContext
{
    None,
    Incoming,
    Outgoing,
    IncomingAndOutgoing
};

const char* to_string(Shape shape);
const char* to_string(Production production);
const char* to_string(Consumption consumption);
const char* to_string(BindingContext context);

// ============================================================================
// Channel Binding
// ============================================================================

/// Binds one side of a mediator to a named channel
struct ChannelBinding
{
    std::string channel;                                // Required, non-empty
    std::optional<std::string> provider = std::nullopt; // Opaque, passed through

    ChannelBinding() = default;
    ChannelBinding(std::string channel_name,
                   std::optional<std::string> provider_tag = std::nullopt)
        : channel(std::move(channel_name)), provider(std::move(provider_tag))
    {
    }

    /// Convert to JSON format
    json to_json() const
    {
        json result = {{"channel", channel}};
        if (provider.has_value())
            result["provider"] = *provider;
        return result;
    }

    /// Create from JSON
    static ChannelBinding from_json(const json& j)
    {
        ChannelBinding binding;
        binding.channel = j.at("channel").get<std::string>();
        if (j.contains("provider") && !j["provider"].is_null())
            binding.provider = j["provider"].get<std::string>();
        return binding;
    }

    bool operator==(const ChannelBinding& other) const
    {
        return channel == other.channel && provider == other.provider;
    }

    bool operator!=(const ChannelBinding& other) const
    {
        return !(*this == other);
    }
};

// ============================================================================
// Registry Options
// ============================================================================

/// Callback receiving one diagnostic line (without trailing newline).
/// When unset, diagnostics are written to std::cerr.
using DiagnosticCallback = std::function<void(const std::string& line)>;

/// Options for the startup classification pass
struct RegistryOptions
{
    /// Stop at the first mediator that fails to classify instead of
    /// collecting every failure.
    bool fail_fast = false;

    /// Log one line per classified mediator.
    bool verbose = false;

    /// Receives diagnostic output. Falls back to std::cerr when not set.
    std::optional<DiagnosticCallback> diagnostic_callback;
};

} // namespace mediate

#endif // MEDIATE_TYPES_HPP
