#ifndef MEDIATE_SIGNATURE_HPP
#define MEDIATE_SIGNATURE_HPP

#include <mediate/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mediate
{

// ============================================================================
// Type Kinds
// ============================================================================

/// Closed set of type shapes recognized by the classifier.
/// Every declared type is tagged once, when its signature is described.
enum class TypeKind
{
    Void,
    Payload,          // Any type that is none of the kinds below
    Message,          // Envelope: payload + metadata + acknowledgement
    Publisher,        // Raw stream source
    PublisherBuilder, // Builder-wrapped stream source
    Processor,        // Raw stream source and sink
    ProcessorBuilder, // Builder-wrapped processor
    Subscriber,       // Raw stream sink
    CompletionStage   // Asynchronous single value
};

/// Lower-case name used in manifests ("publisher_builder", ...)
const char* to_string(TypeKind kind);

/// Parse a lower-case kind name. Returns std::nullopt for unknown names.
std::optional<TypeKind> kind_from_string(const std::string& name);

// ============================================================================
// Type Descriptor
// ============================================================================

/// Reflection-free description of a declared type: its kind, a display name and,
/// for generic types, its ordered type arguments.
struct TypeDescriptor
{
    TypeKind kind = TypeKind::Payload;
    std::string name;
    std::vector<TypeDescriptor> arguments;

    TypeDescriptor() = default;
    TypeDescriptor(TypeKind k, std::string n, std::vector<TypeDescriptor> args = {})
        : kind(k), name(std::move(n)), arguments(std::move(args))
    {
    }

    /// Type argument at @p index, or nullptr when the type is not generic or
    /// declares fewer arguments.
    const TypeDescriptor* argument(size_t index) const
    {
        if (index >= arguments.size())
            return nullptr;
        return &arguments[index];
    }

    bool is_generic() const
    {
        return !arguments.empty();
    }

    /// Readable form, e.g. "Publisher<Message<Price>>"
    std::string to_string() const;

    json to_json() const;

    bool operator==(const TypeDescriptor& other) const
    {
        return kind == other.kind && name == other.name && arguments == other.arguments;
    }

    bool operator!=(const TypeDescriptor& other) const
    {
        return !(*this == other);
    }
};

// ============================================================================
// Capability Checks
// ============================================================================

/// Envelope test, applied to a bare type or to a type argument
bool is_envelope(const TypeDescriptor& type);

/// Raw stream source (a processor is also a publisher)
bool is_publisher(const TypeDescriptor& type);

/// Builder-wrapped stream source
bool is_publisher_builder(const TypeDescriptor& type);

/// Either stream source family
bool is_stream(const TypeDescriptor& type);

/// Raw processor or builder-wrapped processor
bool is_processor(const TypeDescriptor& type);

/// Raw stream sink (a processor is also a subscriber)
bool is_subscriber(const TypeDescriptor& type);

bool is_completion_stage(const TypeDescriptor& type);

bool is_void(const TypeDescriptor& type);

/// Either builder-wrapper family
bool is_builder_type(const TypeDescriptor& type);

// ============================================================================
// Signature
// ============================================================================

/// Declared contract of a mediator callable
struct Signature
{
    std::string identity; // Diagnostics only, e.g. "PriceConverter#process"
    TypeDescriptor return_type{TypeKind::Void, "void"};
    std::vector<TypeDescriptor> parameter_types;

    size_t parameter_count() const
    {
        return parameter_types.size();
    }

    /// Parameter at @p index, or nullptr
    const TypeDescriptor* parameter(size_t index) const
    {
        if (index >= parameter_types.size())
            return nullptr;
        return &parameter_types[index];
    }

    /// Readable form, e.g. "Publisher<Price> PriceSource#generate()"
    std::string to_string() const;

    json to_json() const;

    bool operator==(const Signature& other) const
    {
        return identity == other.identity && return_type == other.return_type &&
               parameter_types == other.parameter_types;
    }

    bool operator!=(const Signature& other) const
    {
        return !(*this == other);
    }
};

} // namespace mediate

#endif // MEDIATE_SIGNATURE_HPP
