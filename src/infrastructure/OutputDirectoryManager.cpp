/**
 * @file OutputDirectoryManager.cpp
 * @brief Implementation of OutputDirectoryManager.
 */

#include "infrastructure/OutputDirectoryManager.hpp"
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace systemviz::infrastructure {

namespace fs = std::filesystem;

std::string OutputDirectoryManager::RunNameFromDataset(const fs::path& datasetPath) {
    std::string stem = datasetPath.stem().string();
    if (stem.empty()) {
        stem = "model";
    }
    return "images_" + stem;
}

fs::path OutputDirectoryManager::Prepare(const fs::path& outputRoot, const std::string& runName) {
    if (!outputRoot.is_absolute()) {
        throw std::runtime_error("Output root must be an absolute path: " + outputRoot.string());
    }
    if (runName.empty() || runName == "." || runName == ".." ||
        fs::path(runName).has_parent_path()) {
        throw std::runtime_error("Invalid run name: '" + runName + "'");
    }

    const fs::path runDir = outputRoot / runName;
    std::error_code ec;

    if (fs::exists(runDir, ec)) {
        std::cout << "[OutputDirectory] Removing previous output " << runDir << std::endl;
        fs::remove_all(runDir, ec);
        if (ec) {
            throw std::runtime_error("Cannot remove " + runDir.string() + ": " + ec.message());
        }
    } else if (ec) {
        throw std::runtime_error("Cannot inspect " + runDir.string() + ": " + ec.message());
    }

    fs::create_directories(runDir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + runDir.string() + ": " + ec.message());
    }
    for (const char* category : kCategoryDirs) {
        fs::create_directory(runDir / category, ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + (runDir / category).string() + ": " + ec.message());
        }
    }

    std::cout << "[OutputDirectory] Prepared " << runDir << std::endl;
    return runDir;
}

} // namespace systemviz::infrastructure
