#ifndef MEDIATE_INTERNAL_MANIFEST_PARSER_HPP
#define MEDIATE_INTERNAL_MANIFEST_PARSER_HPP

#include <mediate/manifest.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mediate
{
namespace internal
{

class ManifestParser
{
  public:
    // Parse a complete manifest document
    static std::vector<MediatorDeclaration> parse(const std::string& json_str);

    // Parse one entry of the "mediators" array
    static MediatorDeclaration parse_declaration(const json& j);

    // Parse a type: payload name string or {"kind", "name", "arguments"} object
    static TypeDescriptor parse_type(const json& j);

  private:
    static std::optional<ChannelBinding> parse_binding(const json& j, const char* key,
                                                       const std::string& identity);
};

} // namespace internal
} // namespace mediate

#endif // MEDIATE_INTERNAL_MANIFEST_PARSER_HPP
