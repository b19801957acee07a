/**
 * @file OutputDirectoryManager.hpp
 * @brief Destructive refresh of the run output tree before a batch starts.
 */

#pragma once

#include <array>
#include <filesystem>
#include <string>

namespace systemviz::infrastructure {

/**
 * @class OutputDirectoryManager
 * @brief Owns the layout `<root>/images_<dataset>/{commodities,processes,results}`.
 *
 * Prepare() must complete before any job is dispatched; it is not safe to
 * call while jobs are writing.
 */
class OutputDirectoryManager {
public:
    static constexpr const char* kCommoditiesDir = "commodities";
    static constexpr const char* kProcessesDir = "processes";
    static constexpr const char* kResultsDir = "results";
    static constexpr std::array<const char*, 3> kCategoryDirs = {kCommoditiesDir, kProcessesDir, kResultsDir};

    /**
     * @brief Derives the run name from the primary input dataset.
     * @param datasetPath e.g. `/data/utopia.json`
     * @return e.g. `images_utopia`
     */
    static std::string RunNameFromDataset(const std::filesystem::path& datasetPath);

    /**
     * @brief Removes `<outputRoot>/<runName>` recursively if present, then recreates it
     *        with the fixed category subdirectories.
     * @param outputRoot Must be absolute.
     * @return Absolute path of the fresh run directory.
     * @throws std::runtime_error on any filesystem failure.
     */
    static std::filesystem::path Prepare(const std::filesystem::path& outputRoot, const std::string& runName);
};

} // namespace systemviz::infrastructure
