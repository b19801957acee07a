/**
 * @file DiagramRenderer.hpp
 * @brief Interface for turning a DOT artifact into an image.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <string>

namespace systemviz::domain {

/**
 * @struct RenderRequest
 * @brief One renderer invocation: `-T<format> -o<outputPath> <inputPath>`.
 */
struct RenderRequest {
    std::string format;
    std::filesystem::path outputPath;
    std::filesystem::path inputPath;
};

/**
 * @struct RenderResult
 * @brief Outcome of a renderer invocation. Output content is never inspected.
 */
struct RenderResult {
    enum class Status {
        Succeeded,    ///< Exit code 0.
        Failed,       ///< Non-zero exit or abnormal termination.
        LaunchFailed, ///< The renderer could not be started.
        TimedOut,     ///< Killed after exceeding the configured timeout.
        Cancelled     ///< Killed because the batch was cancelled.
    };

    Status status = Status::Succeeded;
    int exitCode = 0;
    std::string message;

    bool ok() const { return status == Status::Succeeded; }
};

/**
 * @class DiagramRenderer
 * @brief Abstract blocking renderer. Implementations must be callable from several threads.
 */
class DiagramRenderer {
public:
    virtual ~DiagramRenderer() = default;

    /**
     * @brief Renders one artifact, blocking until the renderer exits.
     * @param request Format and absolute paths.
     * @param cancelled Optional flag; when it becomes true the invocation is aborted.
     */
    virtual RenderResult render(const RenderRequest& request,
                                const std::atomic<bool>* cancelled = nullptr) = 0;
};

} // namespace systemviz::domain
