#include <stdexcept>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "application/DiagramRunService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GraphvizRenderer.hpp"
#include "infrastructure/JsonEnergySystemModel.hpp"
#include "infrastructure/OutputDirectoryManager.hpp"

namespace fs = std::filesystem;
using namespace systemviz;

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFatal = 1;
constexpr int kExitDegraded = 2;

struct CommandLine {
    fs::path dataset;
    fs::path configPath;
    fs::path writeConfigPath;
    nlohmann::json overrides = nlohmann::json::object();
    bool help = false;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " <dataset.json> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <settings.json>     Load render settings (missing file = defaults)\n"
              << "  --format <fmt>               Image format passed to the renderer (svg, png, pdf, ...)\n"
              << "  --jobs <n>                   Concurrency bound, 0 = all processing units\n"
              << "  --output <dir>               Parent directory of images_<dataset>/\n"
              << "  --write-config <path>        Save the effective settings as JSON\n"
              << "  --help                       Show this message\n"
              << "\n"
              << "Exit status: 0 clean run, 2 run completed with failed diagrams, 1 fatal error.\n";
}

std::optional<CommandLine> ParseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const char* option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "[SystemViz] Missing value for " << option << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--config") {
            auto v = value("--config");
            if (!v) return std::nullopt;
            cmd.configPath = *v;
        } else if (arg == "--format") {
            auto v = value("--format");
            if (!v) return std::nullopt;
            cmd.overrides["image_format"] = *v;
        } else if (arg == "--jobs") {
            auto v = value("--jobs");
            if (!v) return std::nullopt;
            try {
                size_t consumed = 0;
                long long jobs = std::stoll(*v, &consumed);
                if (consumed != v->size()) throw std::invalid_argument(*v);
                cmd.overrides["concurrency"] = jobs;
            } catch (const std::exception&) {
                std::cerr << "[SystemViz] --jobs expects a number, got '" << *v << "'" << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--output") {
            auto v = value("--output");
            if (!v) return std::nullopt;
            cmd.overrides["output_root"] = *v;
        } else if (arg == "--write-config") {
            auto v = value("--write-config");
            if (!v) return std::nullopt;
            cmd.writeConfigPath = *v;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[SystemViz] Unknown option " << arg << std::endl;
            return std::nullopt;
        } else if (cmd.dataset.empty()) {
            cmd.dataset = arg;
        } else {
            std::cerr << "[SystemViz] Only one dataset may be given (got '" << arg << "')" << std::endl;
            return std::nullopt;
        }
    }
    return cmd;
}

} // namespace

int main(int argc, char** argv) {
    std::optional<CommandLine> cmd = ParseCommandLine(argc, argv);
    if (!cmd) {
        PrintUsage(argv[0]);
        return kExitFatal;
    }
    if (cmd->help) {
        PrintUsage(argv[0]);
        return kExitClean;
    }
    if (cmd->dataset.empty() && cmd->writeConfigPath.empty()) {
        PrintUsage(argv[0]);
        return kExitFatal;
    }

    std::optional<domain::RenderConfig> config = infrastructure::ConfigLoader::LoadFromFile(cmd->configPath);
    if (!config) {
        return kExitFatal;
    }

    // Command-line options win over the settings file.
    try {
        infrastructure::ConfigLoader::Apply(cmd->overrides, *config);
        config->outputRoot = fs::absolute(config->outputRoot);
    } catch (const std::exception& e) {
        std::cerr << "[SystemViz] Invalid option: " << e.what() << std::endl;
        return kExitFatal;
    }

    if (!cmd->writeConfigPath.empty()) {
        if (!infrastructure::ConfigLoader::Save(cmd->writeConfigPath, *config)) {
            return kExitFatal;
        }
        std::cout << "[SystemViz] Settings written to " << cmd->writeConfigPath.string() << std::endl;
        if (cmd->dataset.empty()) {
            return kExitClean;
        }
    }

    std::optional<infrastructure::JsonEnergySystemModel> model =
        infrastructure::JsonEnergySystemModel::LoadFromFile(cmd->dataset);
    if (!model) {
        return kExitFatal;
    }

    infrastructure::GraphvizRenderer renderer(config->rendererPath, config->rendererTimeout);
    application::DiagramRunService service(*model, *config, renderer);

    application::BatchReport report;
    try {
        report = service.Run(infrastructure::OutputDirectoryManager::RunNameFromDataset(cmd->dataset));
    } catch (const std::exception& e) {
        std::cerr << "[SystemViz] Run aborted: " << e.what() << std::endl;
        return kExitFatal;
    }

    if (report.hasFailures()) {
        std::cerr << "[SystemViz] " << report.failed << " of " << report.outcomes.size()
                  << " diagrams failed" << std::endl;
        return kExitDegraded;
    }
    std::cout << "[SystemViz] Done." << std::endl;
    return kExitClean;
}
