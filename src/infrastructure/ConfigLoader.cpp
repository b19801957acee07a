/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

namespace systemviz::infrastructure {

namespace fs = std::filesystem;

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

const char* LayoutName(domain::ProcessLayout layout) {
    return layout == domain::ProcessLayout::ExplicitVintages ? "explicit_vintages" : "separate_vintages";
}

void ApplyPalette(const nlohmann::json& p, domain::Palette& palette) {
    if (!p.is_object()) {
        throw std::invalid_argument("'palette' must be an object");
    }
    ReadKey(p, "tech", palette.tech);
    ReadKey(p, "commodity", palette.commodity);
    ReadKey(p, "unused", palette.unused);
    ReadKey(p, "input_arrow", palette.inputArrow);
    ReadKey(p, "output_arrow", palette.outputArrow);
    ReadKey(p, "used_font", palette.usedFont);
    ReadKey(p, "unused_font", palette.unusedFont);
    ReadKey(p, "incoming_commodity", palette.incomingCommodity);
    ReadKey(p, "outgoing_commodity", palette.outgoingCommodity);
    ReadKey(p, "cluster_background", palette.clusterBackground);
    ReadKey(p, "cluster_node", palette.clusterNode);
    ReadKey(p, "flow_arrow", palette.flowArrow);
    ReadKey(p, "rainbow", palette.rainbow);
    if (palette.rainbow.empty()) {
        throw std::invalid_argument("'palette.rainbow' must list at least one color");
    }
}

} // namespace

void ConfigLoader::Apply(const nlohmann::json& j, domain::RenderConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("settings must be a JSON object");
    }

    if (j.contains("image_format")) {
        config.imageFormat = ToLower(j.at("image_format").get<std::string>());
        if (config.imageFormat.empty()) {
            throw std::invalid_argument("'image_format' must not be empty");
        }
    }
    ReadKey(j, "renderer", config.rendererPath);
    if (j.contains("renderer_timeout_seconds")) {
        long long seconds = j.at("renderer_timeout_seconds").get<long long>();
        if (seconds < 0) {
            throw std::invalid_argument("'renderer_timeout_seconds' must not be negative");
        }
        config.rendererTimeout = std::chrono::seconds(seconds);
    }
    if (j.contains("concurrency")) {
        long long value = j.at("concurrency").get<long long>();
        if (value < 0) {
            throw std::invalid_argument("'concurrency' must not be negative");
        }
        if (static_cast<unsigned long long>(value) > std::numeric_limits<unsigned>::max()) {
            throw std::invalid_argument("'concurrency' is out of range: " + std::to_string(value));
        }
        config.concurrency = static_cast<unsigned>(value);
    }
    if (j.contains("significance_threshold")) {
        config.significanceThreshold = j.at("significance_threshold").get<double>();
        if (config.significanceThreshold < 0.0) {
            throw std::invalid_argument("'significance_threshold' must not be negative");
        }
    }
    if (j.contains("output_root")) {
        config.outputRoot = fs::path(j.at("output_root").get<std::string>());
    }
    if (j.contains("process_layout")) {
        std::string layout = j.at("process_layout").get<std::string>();
        if (layout == "separate_vintages") {
            config.processLayout = domain::ProcessLayout::SeparateVintages;
        } else if (layout == "explicit_vintages") {
            config.processLayout = domain::ProcessLayout::ExplicitVintages;
        } else {
            throw std::invalid_argument("unknown 'process_layout': " + layout);
        }
    }
    ReadKey(j, "show_capacity", config.showCapacity);
    ReadKey(j, "splines", config.splines);
    if (j.contains("palette")) {
        ApplyPalette(j.at("palette"), config.palette);
    }
}

std::optional<domain::RenderConfig> ConfigLoader::LoadFromFile(const fs::path& settingsPath) {
    domain::RenderConfig config;

    if (!settingsPath.empty() && fs::exists(settingsPath)) {
        try {
            std::ifstream f(settingsPath);
            nlohmann::json j;
            f >> j;
            Apply(j, config);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << settingsPath.string() << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    } else if (!settingsPath.empty()) {
        std::cout << "[ConfigLoader] " << settingsPath.string() << " not found, using defaults." << std::endl;
    }

    // Jobs only ever receive absolute paths.
    try {
        config.outputRoot = config.outputRoot.empty() ? fs::current_path() : fs::absolute(config.outputRoot);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[ConfigLoader] Cannot resolve output root: " << e.what() << std::endl;
        return std::nullopt;
    }
    return config;
}

nlohmann::json ConfigLoader::ToJson(const domain::RenderConfig& config) {
    const auto& p = config.palette;
    nlohmann::json j;
    j["image_format"] = config.imageFormat;
    j["renderer"] = config.rendererPath;
    j["renderer_timeout_seconds"] = config.rendererTimeout.count();
    j["concurrency"] = config.concurrency;
    j["significance_threshold"] = config.significanceThreshold;
    j["output_root"] = config.outputRoot.string();
    j["process_layout"] = LayoutName(config.processLayout);
    j["show_capacity"] = config.showCapacity;
    j["splines"] = config.splines;
    j["palette"] = {
        {"tech", p.tech},
        {"commodity", p.commodity},
        {"unused", p.unused},
        {"input_arrow", p.inputArrow},
        {"output_arrow", p.outputArrow},
        {"used_font", p.usedFont},
        {"unused_font", p.unusedFont},
        {"incoming_commodity", p.incomingCommodity},
        {"outgoing_commodity", p.outgoingCommodity},
        {"cluster_background", p.clusterBackground},
        {"cluster_node", p.clusterNode},
        {"flow_arrow", p.flowArrow},
        {"rainbow", p.rainbow},
    };
    return j;
}

bool ConfigLoader::Save(const fs::path& settingsPath, const domain::RenderConfig& config) {
    try {
        std::ofstream f(settingsPath);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << settingsPath.string() << " for writing" << std::endl;
            return false;
        }
        f << ToJson(config).dump(4) << "\n";
        return !f.fail();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << settingsPath.string() << ": " << e.what() << std::endl;
        return false;
    }
}

unsigned ConfigLoader::EffectiveConcurrency(const domain::RenderConfig& config) {
    if (config.concurrency > 0) {
        return config.concurrency;
    }
    unsigned hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

} // namespace systemviz::infrastructure
