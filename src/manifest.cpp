#include <mediate/errors.hpp>
#include <mediate/manifest.hpp>

#include "internal/manifest_parser.hpp"

#include <fstream>
#include <sstream>

namespace mediate
{

std::vector<MediatorDeclaration> parse_manifest(const std::string& json_str)
{
    return internal::ManifestParser::parse(json_str);
}

std::vector<MediatorDeclaration> load_manifest(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw ManifestParseError("Cannot open manifest: " + path);

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_manifest(contents.str());
}

void register_manifest(MediatorRegistry& registry,
                       const std::vector<MediatorDeclaration>& declarations)
{
    for (const auto& declaration : declarations)
        registry.add(declaration.signature, declaration.incoming, declaration.outgoing);
}

} // namespace mediate
