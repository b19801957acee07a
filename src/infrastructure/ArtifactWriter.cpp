/**
 * @file ArtifactWriter.cpp
 * @brief Implementation of ArtifactWriter.
 */

#include "infrastructure/ArtifactWriter.hpp"
#include <chrono>
#include <fstream>
#include <system_error>
#include <thread>
#include <sstream>

namespace systemviz::infrastructure {

namespace fs = std::filesystem;

bool ArtifactWriter::Write(const fs::path& path, const std::string& content, std::string& error) {
    if (!path.has_parent_path() || !fs::is_directory(path.parent_path())) {
        error = "Output directory does not exist: " + path.parent_path().string();
        return false;
    }

    // Unique per writer: timestamp plus thread id, since jobs write concurrently.
    std::ostringstream suffix;
    suffix << "." << std::chrono::steady_clock::now().time_since_epoch().count()
           << "." << std::this_thread::get_id() << ".tmp";
    fs::path tempPath = path;
    tempPath += suffix.str();

    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            error = "Failed to open temp file: " + tempPath.string();
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "Write failed during output: " + tempPath.string();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        error = "Rename to " + path.string() + " failed: " + ec.message();
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }
    return true;
}

} // namespace systemviz::infrastructure
