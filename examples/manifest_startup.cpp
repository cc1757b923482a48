/**
 * @file manifest_startup.cpp
 * @brief Startup classification driven by a JSON manifest
 *
 * Usage: example_manifest_startup [manifest.json]
 * Defaults to examples/manifests/prices.json.
 */

#include <mediate/mediate.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
    std::string path = argc > 1 ? argv[1] : "examples/manifests/prices.json";

    mediate::RegistryOptions opts;
    opts.verbose = true;
    mediate::MediatorRegistry registry(opts);

    try
    {
        auto declarations = mediate::load_manifest(path);
        std::cout << "Loaded " << declarations.size() << " declarations from " << path << "\n";

        mediate::register_manifest(registry, declarations);
        registry.classify_all();
    }
    catch (const mediate::StartupError& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    catch (const mediate::MediateError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (const auto* enricher = registry.find("PriceEnricher#enrich"))
    {
        std::cout << "\nPriceEnricher#enrich wiring:\n"
                  << enricher->to_json().dump(2) << "\n";
    }
    return 0;
}
