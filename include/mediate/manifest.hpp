#ifndef MEDIATE_MANIFEST_HPP
#define MEDIATE_MANIFEST_HPP

#include <mediate/registry.hpp>
#include <mediate/signature.hpp>
#include <mediate/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mediate
{

/// One mediator described declaratively instead of through C++ type deduction
struct MediatorDeclaration
{
    Signature signature;
    std::optional<ChannelBinding> incoming = std::nullopt;
    std::optional<ChannelBinding> outgoing = std::nullopt;
};

/// Parse a JSON signature manifest:
/// @code
/// {"mediators": [{"identity": "PriceConverter#process",
///                 "incoming": {"channel": "prices"},
///                 "outgoing": {"channel": "my-data-stream", "provider": "kafka"},
///                 "returns": "double",
///                 "parameters": [{"kind": "message", "name": "Message", "arguments": ["int"]}]}]}
/// @endcode
/// A type is either a payload type name ("void" is the void type) or an object
/// with "kind" (lower-case TypeKind name), optional "name" and "arguments".
/// Throws JSONDecodeError or ManifestParseError.
std::vector<MediatorDeclaration> parse_manifest(const std::string& json_str);

/// Read and parse a manifest file
std::vector<MediatorDeclaration> load_manifest(const std::string& path);

/// Register every declaration of a manifest
void register_manifest(MediatorRegistry& registry,
                       const std::vector<MediatorDeclaration>& declarations);

} // namespace mediate

#endif // MEDIATE_MANIFEST_HPP
