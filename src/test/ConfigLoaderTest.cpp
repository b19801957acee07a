#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace systemviz;
using systemviz::infrastructure::ConfigLoader;
namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const fs::path testRoot = fs::absolute("test_config_root");
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // Missing file: documented defaults, absolute output root.
    {
        auto config = ConfigLoader::LoadFromFile(testRoot / "missing.json");
        assert(config);
        assert(config->imageFormat == "svg");
        assert(config->rendererPath == "dot");
        assert(config->rendererTimeout == std::chrono::seconds(120));
        assert(config->concurrency == 0);
        assert(config->significanceThreshold == 0.005);
        assert(config->processLayout == domain::ProcessLayout::SeparateVintages);
        assert(!config->showCapacity);
        assert(config->palette.tech == "darkseagreen");
        assert(config->palette.rainbow.size() == 13);
        assert(config->outputRoot.is_absolute());
        std::cout << "[PASS] Missing settings file yields defaults." << std::endl;
    }

    // Partial file overrides only the keys present.
    {
        WriteFile(testRoot / "partial.json", R"({
            "image_format": "PNG",
            "concurrency": 3,
            "significance_threshold": 0.1,
            "output_root": "out",
            "process_layout": "explicit_vintages",
            "show_capacity": true,
            "palette": { "tech": "hotpink", "rainbow": ["red", "blue"] },
            "some_future_key": 42
        })");
        auto config = ConfigLoader::LoadFromFile(testRoot / "partial.json");
        assert(config);
        assert(config->imageFormat == "png");
        assert(config->concurrency == 3);
        assert(config->significanceThreshold == 0.1);
        assert(config->processLayout == domain::ProcessLayout::ExplicitVintages);
        assert(config->showCapacity);
        assert(config->palette.tech == "hotpink");
        assert(config->palette.commodity == "lightsteelblue");
        assert(config->palette.rainbow.size() == 2);
        assert(config->outputRoot.is_absolute());
        assert(config->outputRoot.filename() == "out");
        assert(config->rendererPath == "dot");
        assert(ConfigLoader::EffectiveConcurrency(*config) == 3);
        std::cout << "[PASS] Settings file overrides defaults." << std::endl;
    }

    // Malformed or invalid files are load errors.
    {
        WriteFile(testRoot / "broken.json", "{ \"image_format\": ");
        assert(!ConfigLoader::LoadFromFile(testRoot / "broken.json"));

        WriteFile(testRoot / "wrong_type.json", R"({ "concurrency": "two" })");
        assert(!ConfigLoader::LoadFromFile(testRoot / "wrong_type.json"));

        WriteFile(testRoot / "negative.json", R"({ "renderer_timeout_seconds": -5 })");
        assert(!ConfigLoader::LoadFromFile(testRoot / "negative.json"));

        WriteFile(testRoot / "layout.json", R"({ "process_layout": "diagonal" })");
        assert(!ConfigLoader::LoadFromFile(testRoot / "layout.json"));

        WriteFile(testRoot / "rainbow.json", R"({ "palette": { "rainbow": [] } })");
        assert(!ConfigLoader::LoadFromFile(testRoot / "rainbow.json"));

        // Would wrap to 0 ("all processing units") if narrowed.
        WriteFile(testRoot / "huge_jobs.json", R"({ "concurrency": 4294967296 })");
        assert(!ConfigLoader::LoadFromFile(testRoot / "huge_jobs.json"));

        domain::RenderConfig config;
        bool threw = false;
        try {
            ConfigLoader::Apply(nlohmann::json{{"concurrency", 4294967297LL}}, config);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(config.concurrency == 0);
        std::cout << "[PASS] Malformed settings are rejected." << std::endl;
    }

    // Saved settings load back to the same configuration.
    {
        domain::RenderConfig config;
        config.imageFormat = "pdf";
        config.rendererTimeout = std::chrono::seconds(7);
        config.splines = "ortho";
        config.outputRoot = testRoot;
        config.palette.unused = "gray90";
        assert(ConfigLoader::Save(testRoot / "saved.json", config));

        auto loaded = ConfigLoader::LoadFromFile(testRoot / "saved.json");
        assert(loaded);
        assert(loaded->imageFormat == "pdf");
        assert(loaded->rendererTimeout == std::chrono::seconds(7));
        assert(loaded->splines == "ortho");
        assert(loaded->outputRoot == testRoot);
        assert(loaded->palette.unused == "gray90");
        assert(ConfigLoader::ToJson(*loaded) == ConfigLoader::ToJson(config));
        assert(!ConfigLoader::ToJson(config).at("palette").contains("home"));
        std::cout << "[PASS] Saved settings reload unchanged." << std::endl;
    }

    // Keys no diagram uses are accepted and dropped.
    {
        WriteFile(testRoot / "legacy.json", R"({ "palette": { "home": "gray75", "tech": "khaki" } })");
        auto config = ConfigLoader::LoadFromFile(testRoot / "legacy.json");
        assert(config);
        assert(config->palette.tech == "khaki");
        assert(!ConfigLoader::ToJson(*config).at("palette").contains("home"));
        std::cout << "[PASS] Unused palette keys are ignored." << std::endl;
    }

    // Concurrency 0 resolves to at least one worker.
    {
        domain::RenderConfig config;
        assert(ConfigLoader::EffectiveConcurrency(config) >= 1);
        std::cout << "[PASS] Concurrency 0 resolves to the host count." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
