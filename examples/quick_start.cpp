#include <mediate/mediate.hpp>

#include <iostream>
#include <memory>
#include <string>

constexpr bool VERBOSE = true;

namespace
{

// Minimal in-memory stream: emits a fixed set of prices to one subscriber
class PriceFeed : public mediate::Publisher<int>
{
  public:
    void subscribe(std::shared_ptr<mediate::Subscriber<int>> subscriber) override
    {
        for (int price : {100, 250, 999})
            subscriber->on_next(price);
        subscriber->on_complete();
    }
};

} // namespace

int main()
{
    std::cout << "mediate version: " << mediate::version_string() << "\n\n";

    mediate::RegistryOptions opts;
    opts.verbose = VERBOSE;
    opts.diagnostic_callback = [](const std::string& line) { std::cout << line << "\n"; };

    mediate::MediatorRegistry registry(opts);

    // Source: a stream of raw prices
    registry.add(
        "PriceFeed#prices",
        []() -> std::shared_ptr<mediate::Publisher<int>> { return std::make_shared<PriceFeed>(); },
        std::nullopt, mediate::ChannelBinding{"prices"});

    // Processor: one price in, one converted price out
    auto to_euro = mediate::make_mediator(
        "PriceConverter#process", [](int price_in_usd) { return price_in_usd * 0.88; },
        mediate::ChannelBinding{"prices"}, mediate::ChannelBinding{"my-data-stream"});
    registry.add_mediator(to_euro);

    // Sink: consumes enveloped values and acknowledges them
    registry.add(
        "PriceSink#consume",
        [](const mediate::Message<double>& msg)
        {
            std::cout << "  received " << msg.payload() << "\n";
            msg.ack();
        },
        mediate::ChannelBinding{"my-data-stream"}, std::nullopt);

    try
    {
        const auto& configs = registry.classify_all();
        std::cout << "\nClassified " << configs.size() << " mediators\n";
        for (const auto& config : configs)
            std::cout << config.to_json().dump() << "\n";
    }
    catch (const mediate::StartupError& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "\nInvoking " << to_euro.identity() << ": 100 -> " << to_euro(100) << "\n";
    return 0;
}
