// main.cpp
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <Strata/Strata.hpp>

using namespace Strata::Containers;
using namespace Strata::Memory;
using Strata::Utilities::StringInterner;

// Symbols keep their id and view while the table keeps growing
void InternSymbols()
{
    StringInterner   symbols;
    std::string_view main = symbols.Intern("main");

    for (int i = 0; i < 1000; ++i)
        (void) symbols.InsertOrGet("local" + std::to_string(i));

    std::cout << "[InternSymbols] " << symbols.Size() << " symbols, 'main' is still '" << main
              << "' with id " << symbols.InsertOrGet("main") << "\n";

    const auto stats = symbols.GetStatistics();
    std::cout << "[InternSymbols] lookups=" << stats.lookups << " hits=" << stats.lookupHits
              << " bytes=" << stats.totalBytesStored << "\n";
}

// Lazily built configuration values, handed out by reference
void LazyDefaults()
{
    const AppendOnlyMap<std::string, Scoped<std::string>, InsertionOrderedStorage<>> defaults;
    const std::string& home = defaults.GetOrInsertWith("home", [] { return MakeScoped<std::string>("/home/strata"); });
    defaults.GetOrInsertWith("cache", [&defaults](const std::string& key) {
        return MakeScoped<std::string>(defaults.Get(std::string("home")) + "/." + key);
    });

    defaults.ForEach([](const std::string& key, const std::string& value) {
        std::cout << "[LazyDefaults] " << key << " = " << value << "\n";
    });
    std::cout << "[LazyDefaults] home still reads " << home << "\n";
}

// Several threads racing to create the same entry observe one value
void SharedRegistry()
{
    const SyncAppendOnlyMap<std::string, Shared<std::string>> registry;
    std::vector<std::thread>                                   workers;
    for (int i = 0; i < 4; ++i)
    {
        workers.emplace_back([&registry, i] {
            const std::string& owner = registry.GetOrInsertWith("owner", [i] {
                return MakeShared<std::string>("worker " + std::to_string(i));
            });
            (void) owner;
        });
    }
    for (auto& worker : workers)
        worker.join();

    std::cout << "[SharedRegistry] " << registry.Size() << " entry, owner = " << registry.Get(std::string("owner")) << "\n";
}

int main()
{
    InternSymbols();
    LazyDefaults();
    SharedRegistry();
    return 0;
}
