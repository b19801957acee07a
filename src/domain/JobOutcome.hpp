/**
 * @file JobOutcome.hpp
 * @brief Terminal result of one diagram job.
 */

#pragma once

#include <filesystem>
#include <string>

namespace systemviz::domain {

/**
 * @enum JobStatus
 * @brief Terminal status reported once per diagram job.
 */
enum class JobStatus {
    Succeeded,      ///< Artifact written and rendered.
    SkippedEmpty,   ///< Nothing to draw for this scope; no artifact written.
    WriteFailed,    ///< The artifact could not be written.
    RendererFailed, ///< Renderer exited non-zero or could not be launched.
    TimedOut,       ///< Renderer exceeded the configured timeout.
    Cancelled,      ///< Batch cancelled before or while the job ran.
    Failed          ///< Unexpected exception inside the job.
};

inline const char* ToString(JobStatus status) {
    switch (status) {
        case JobStatus::Succeeded: return "ok";
        case JobStatus::SkippedEmpty: return "skipped (nothing to draw)";
        case JobStatus::WriteFailed: return "write failed";
        case JobStatus::RendererFailed: return "renderer failed";
        case JobStatus::TimedOut: return "timed out";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

/** @brief True for the statuses that make a batch degraded. */
inline bool IsFailure(JobStatus status) {
    return status != JobStatus::Succeeded && status != JobStatus::SkippedEmpty;
}

/**
 * @struct JobOutcome
 * @brief Status plus the scope it belongs to and the files involved.
 */
struct JobOutcome {
    std::string scopeKey;
    std::string family;
    JobStatus status = JobStatus::Succeeded;
    std::string message;
    std::filesystem::path artifactPath; ///< Empty for SkippedEmpty.
    std::filesystem::path imagePath;
};

} // namespace systemviz::domain
