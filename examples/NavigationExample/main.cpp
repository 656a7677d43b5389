#include <iostream>
#include <print>

#include <JNAV/JNAV.hpp>
using namespace JNAV::Navigation;

int main()
{
    const char* input = R"({
        "service": "inventory",
        "replicas": 3,
        "enabled": true,
        "limits": {"cpu": 1.5, "memory": 512},
        "zones": ["eu-west", "us-east"]
    })";

    auto parsed = Document::Parse(input);
    if (!parsed.HasValue())
    {
        std::cerr << "Parse failed: " << parsed.ErrorUnsafe() << std::endl;
        return 1;
    }
    const Node root = parsed.ValueUnsafe();

    // Chained navigation
    std::cout << "Service: " << root.ByKey("service").AsString().ValueOr("?") << std::endl;
    std::cout << "Replicas: " << root.ByKey("replicas").AsInt().ValueOr(0) << std::endl;
    std::cout << "Second zone: " << root.ByKey("zones").ByIndex(1).AsStringView().ValueOr("?") << std::endl;

    // Truncating coercion
    std::cout << "CPU (Int): " << root.At({"limits", "cpu"}).AsInt().ValueOr(0) << std::endl;

    // A failing chain reports the first failure only
    auto missing = root.ByKey("limits").ByKey("disk").ByIndex(0).AsInt64();
    if (!missing.HasValue())
        std::println("Missing: {}", missing.ErrorUnsafe());

    auto mismatch = root.ByKey("zones").AsMap();
    if (!mismatch.HasValue())
        std::println("Mismatch: {}", mismatch.ErrorUnsafe());

    // Lazy construction builds children on first visit
    NavigationOptions options;
    options.construction        = Construction::Lazy;
    options.parse.trackLocation = true;

    auto lazy = Document::Parse(R"({"items": [{"id": 1}, {"id": null}]})", options);
    if (lazy.HasValue())
    {
        const Node items = lazy.ValueUnsafe().ByKey("items");
        std::println("Items: {}", items.Size());
        std::println("First id: {}", items.ByIndex(0).ByKey("id").AsInt().ValueOr(-1));
        std::println("Second id: {}", items.ByIndex(1).ByKey("id").GetError());
    }

    // Malformed text surfaces the decoder's location
    auto broken = Document::Parse("{\"a\": [1, 2,, 3]}", options);
    if (!broken.HasValue())
        std::println("Broken: {}", broken.ErrorUnsafe());

    return 0;
}
