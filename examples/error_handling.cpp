/**
 * @file error_handling.cpp
 * @brief Error handling example
 *
 * Demonstrates:
 * - Catching a ConfigurationError for a single signature
 * - Inspecting failures without exceptions through try_classify()
 * - Collecting every failure of a startup pass in a StartupError
 * - Stopping at the first failure with fail_fast
 */

#include <mediate/mediate.hpp>
#include <iostream>
#include <string>

using namespace mediate;

void print_scenario(const std::string& scenario)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Scenario: " << scenario << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

// Example 1: a mis-shaped callable is refused when it is wrapped
void example_configuration_error()
{
    print_scenario("Mis-shaped publisher");

    try
    {
        // A publisher must not take parameters
        auto source = make_publisher("Source#broken", [](int seed) { return seed + 1; },
                                     ChannelBinding{"numbers"});
        std::cout << "Unexpectedly classified as " << to_string(source.configuration().shape())
                  << "\n";
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "✗ " << e.what() << "\n";
        std::cerr << "  context:  " << to_string(e.context()) << "\n";
        std::cerr << "  identity: " << e.identity() << "\n";
        std::cerr << "  reason:   " << e.reason() << "\n";
    }
}

// Example 2: query without throwing
void example_try_classify()
{
    print_scenario("try_classify");

    Signature sig = describe("Sink#subscriber", []() -> std::shared_ptr<Subscriber<int>>
                             { return nullptr; });

    ClassificationResult result = try_classify(sig, ChannelBinding{"numbers"}, std::nullopt);
    if (result)
        std::cout << "✓ " << sig.to_string() << " is a " << to_string(result.value().shape())
                  << "\n";
    else
        std::cerr << "✗ " << result.error()->message() << "\n";

    // Same signature bound on the wrong side
    result = try_classify(sig, std::nullopt, ChannelBinding{"numbers"});
    if (!result)
        std::cerr << "✗ " << result.error()->message() << "\n";
}

// Example 3: every failure is reported before startup aborts
void example_startup_error(bool fail_fast)
{
    print_scenario(fail_fast ? "Startup pass (fail fast)" : "Startup pass (collect all)");

    RegistryOptions opts;
    opts.fail_fast = fail_fast;
    opts.diagnostic_callback = [](const std::string& line) { std::cerr << line << "\n"; };

    MediatorRegistry registry(opts);
    registry.add("Source#void", []() {}, std::nullopt, ChannelBinding{"a"});
    registry.add("Processor#fine", [](int x) { return x; }, ChannelBinding{"a"},
                 ChannelBinding{"b"});
    registry.add(
        "Processor#twoArgs", [](int x, int y) { return x + y; }, ChannelBinding{"b"},
        ChannelBinding{"c"});

    try
    {
        registry.add("Orphan#run", [](int x) { return x; }, std::nullopt, std::nullopt);
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "✗ Rejected on registration: " << e.what() << "\n";
    }

    try
    {
        registry.classify_all();
        std::cout << "✓ Startup succeeded\n";
    }
    catch (const StartupError& e)
    {
        std::cerr << "\n✗ Startup aborted, " << e.failures().size() << " failure(s):\n";
        for (const auto& failure : e.failures())
            std::cerr << "  " << failure.identity << ": " << failure.reason << "\n";
    }
}

int main()
{
    example_configuration_error();
    example_try_classify();
    example_startup_error(false);
    example_startup_error(true);
    return 0;
}
