#undef NDEBUG
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "infrastructure/JsonEnergySystemModel.hpp"
#include "TestFixtures.hpp"

using namespace systemviz;
using systemviz::infrastructure::JsonEnergySystemModel;
namespace fs = std::filesystem;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JsonEnergySystemModel Test..." << std::endl;

    const auto model = JsonEnergySystemModel::FromJson(nlohmann::json::parse(test::kMiniDataset), "fallback");

    // Sets come back sorted.
    {
        assert(model.name() == "mini");
        assert((model.technologies() == std::vector<std::string>{"e_coal", "e_wind", "imp_coal", "unused_tech"}));
        assert((model.physicalCarriers() == std::vector<std::string>{"coal", "elc", "ethos"}));
        assert((model.emissionCommodities() == std::vector<std::string>{"co2", "nox"}));
        assert((model.optimizationPeriods() == std::vector<int>{2000, 2010}));
        assert((model.horizonPeriods() == std::vector<int>{2000, 2010, 2020}));
        assert((model.seasons() == std::vector<std::string>{"summer", "winter"}));
        assert((model.timesOfDay() == std::vector<std::string>{"day", "night"}));
        std::cout << "[PASS] Sets." << std::endl;
    }

    // Lifetimes bound the periods a vintage is active in.
    {
        auto processes = model.activeProcesses();
        assert(processes.size() == 5);
        assert(model.validActivity(2000, "e_coal", 2000));
        assert(!model.validActivity(2010, "e_coal", 2000));
        assert(model.validActivity(2010, "imp_coal", 2000));
        assert(!model.validActivity(2000, "e_wind", 2010));
        assert((model.processVintages(2010, "e_coal") == std::vector<int>{2010}));
        assert((model.processVintages(2010, "imp_coal") == std::vector<int>{2000}));
        assert(model.processVintages(2000, "unused_tech").empty());
        std::cout << "[PASS] Active processes honour lifetimes." << std::endl;
    }

    // Structural lookups.
    {
        domain::ProcessKey key{2000, "e_coal", 2000};
        assert((model.processInputs(key) == std::vector<std::string>{"coal"}));
        assert((model.processOutputs(key) == std::vector<std::string>{"elc"}));
        assert((model.processOutputsByInput(key, "coal") == std::vector<std::string>{"elc"}));
        assert(model.processOutputsByInput(key, "ethos").empty());
        assert(model.processInputs(domain::ProcessKey{1990, "e_coal", 2000}).empty());

        auto producers = model.processesByOutput("elc");
        assert(producers.size() == 3);
        assert(producers[0] == (domain::TechVintage{"e_coal", 2000}));
        assert(producers[2] == (domain::TechVintage{"e_wind", 2010}));
        auto consumers = model.processesByInput("ethos");
        assert(consumers.size() == 2);
        assert(model.processesByInput("elc").empty());
        std::cout << "[PASS] Structural lookups." << std::endl;
    }

    // Results and their aggregates.
    {
        assert(model.hasResults());
        assert(Near(model.vintageCapacity("e_coal", 2000), 1.5));
        assert(Near(model.vintageCapacity("unused_tech", 2000), 0.0));
        assert(model.capacityAvailable(2010, "e_wind").has_value());
        assert(Near(*model.capacityAvailable(2010, "e_wind"), 0.0));
        assert(!model.capacityAvailable(2000, "e_wind").has_value());

        assert(Near(model.activity(2000, "e_coal", 2000), 1.0003));
        assert(Near(model.energyConsumption(2000, "coal", "e_coal"), 3.001));
        assert(Near(model.activityByOutput(2010, "imp_coal", "coal"), 2.0));

        domain::FlowKey flow{2000, "summer", "day", "coal", "e_coal", 2000, "elc"};
        assert(Near(model.flowIn(flow), 3.0));
        assert(Near(model.flowOut(flow), 1.0));
        flow.season = "winter";
        assert(Near(model.flowIn(flow), 0.0));

        assert(model.emissionActivityKeys().size() == 2);
        assert(Near(model.emissionActivity("co2", 2000, "e_coal"), 0.50015));
        assert(Near(model.emissionActivity("co2", 2010, "e_coal"), 0.32));
        assert(Near(model.emissionActivity("nox", 2000, "e_coal"), 0.0));
        std::cout << "[PASS] Results and derived emissions." << std::endl;
    }

    // Structure-only dataset.
    {
        auto j = nlohmann::json::parse(test::kMiniDataset);
        j.erase("results");
        j.erase("name");
        j["periods"].erase("horizon");
        auto bare = JsonEnergySystemModel::FromJson(j, "fallback");
        assert(bare.name() == "fallback");
        assert(!bare.hasResults());
        assert((bare.horizonPeriods() == std::vector<int>{2000, 2010}));
        assert(Near(bare.activity(2000, "e_coal", 2000), 0.0));
        std::cout << "[PASS] Dataset without results." << std::endl;
    }

    // Invalid input.
    {
        bool threw = false;
        try {
            JsonEnergySystemModel::FromJson(nlohmann::json::parse(R"({"name": "x"})"), "x");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            JsonEnergySystemModel::FromJson(nlohmann::json::parse(
                R"({"efficiency": [{"input": "", "tech": "t", "vintage": 2000, "output": "o"}]})"), "x");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Invalid datasets are rejected." << std::endl;
    }

    // File loading.
    {
        const fs::path testRoot = fs::absolute("test_model_root");
        fs::remove_all(testRoot);
        fs::create_directories(testRoot);

        assert(!JsonEnergySystemModel::LoadFromFile(testRoot / "missing.json"));

        { std::ofstream f(testRoot / "broken.json"); f << "{ not json"; }
        assert(!JsonEnergySystemModel::LoadFromFile(testRoot / "broken.json"));

        { std::ofstream f(testRoot / "utopia.json"); f << test::kMiniDataset; }
        auto loaded = JsonEnergySystemModel::LoadFromFile(testRoot / "utopia.json");
        assert(loaded);
        assert(loaded->name() == "mini");
        assert(loaded->activeProcesses().size() == 5);

        fs::remove_all(testRoot);
        std::cout << "[PASS] Loading from file." << std::endl;
    }

    std::cout << "[Test] All JsonEnergySystemModel tests passed." << std::endl;
    return 0;
}
