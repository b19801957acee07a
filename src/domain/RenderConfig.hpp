/**
 * @file RenderConfig.hpp
 * @brief Typed configuration shared read-only by every diagram job.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace systemviz::domain {

/**
 * @enum ProcessLayout
 * @brief Layout strategy for per-technology process diagrams.
 */
enum class ProcessLayout {
    SeparateVintages, ///< Vintages and periods in two clusters.
    ExplicitVintages  ///< One node per (period, vintage) pair.
};

/**
 * @struct Palette
 * @brief Graphviz color names used by the diagram families.
 */
struct Palette {
    std::string tech = "darkseagreen";
    std::string commodity = "lightsteelblue";
    std::string unused = "powderblue";
    std::string inputArrow = "firebrick";
    std::string outputArrow = "forestgreen";
    std::string usedFont = "black";
    std::string unusedFont = "chocolate";
    std::string incomingCommodity = "lightsteelblue";
    std::string outgoingCommodity = "lawngreen";
    std::string clusterBackground = "lightgrey";
    std::string clusterNode = "white";
    std::string flowArrow = "forestgreen";
    /// Cycled over vintage->period edges so neighbouring connections stay distinguishable.
    std::vector<std::string> rainbow = {"red",   "orange",    "gold",  "green",     "blue",
                                        "purple", "hotpink",  "cyan",  "burlywood", "coral",
                                        "limegreen", "black", "brown"};
};

/**
 * @struct RenderConfig
 * @brief Run configuration with documented defaults.
 */
struct RenderConfig {
    std::string imageFormat = "svg";           ///< Renderer -T selector and image suffix.
    std::string rendererPath = "dot";          ///< Executable name or path of the layout tool.
    std::chrono::seconds rendererTimeout{120}; ///< Per-invocation limit; 0 disables it.
    unsigned concurrency = 0;                  ///< 0 = host processing-unit count.
    double significanceThreshold = 0.005;      ///< Flows below this are drawn as unused.
    std::filesystem::path outputRoot;          ///< Absolute; parent of the run directory.
    ProcessLayout processLayout = ProcessLayout::SeparateVintages;
    bool showCapacity = false;
    std::string splines = "true";
    Palette palette;
};

} // namespace systemviz::domain
