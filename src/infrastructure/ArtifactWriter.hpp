/**
 * @file ArtifactWriter.hpp
 * @brief Atomic text-file writes for diagram artifacts.
 */

#pragma once

#include <filesystem>
#include <string>

namespace systemviz::infrastructure {

/**
 * @class ArtifactWriter
 * @brief Writes a whole artifact through a temp file and a rename.
 *
 * Readers (the renderer, a browser following cross-links) never observe a
 * half-written artifact. Stateless; safe to share between jobs.
 */
class ArtifactWriter {
public:
    /**
     * @brief Writes @p content to @p path.
     * @param path Absolute destination path. The parent directory must exist.
     * @param content Full artifact text.
     * @param error Receives a description on failure.
     * @return True on success.
     */
    static bool Write(const std::filesystem::path& path, const std::string& content, std::string& error);
};

} // namespace systemviz::infrastructure
