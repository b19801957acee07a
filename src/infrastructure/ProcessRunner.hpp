/**
 * @file ProcessRunner.hpp
 * @brief Blocking child-process execution with timeout and cancellation.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace systemviz::infrastructure {

/**
 * @struct ProcessResult
 * @brief How a child process ended.
 */
struct ProcessResult {
    enum class Status {
        Exited,       ///< Normal exit; see exitCode.
        Signaled,     ///< Terminated by a signal it did not expect.
        LaunchFailed, ///< Could not be started.
        TimedOut,     ///< Killed after the timeout elapsed.
        Cancelled     ///< Killed because the cancel flag was raised.
    };

    Status status = Status::Exited;
    int exitCode = 0;
    std::string message;
};

/**
 * @class ProcessRunner
 * @brief Spawns a program directly (no shell) and waits for it.
 */
class ProcessRunner {
public:
    /** @brief False on platforms without posix_spawn; Run() then goes through std::system. */
    static bool SupportsSpawn();

    /**
     * @brief Runs @p argv (argv[0] is looked up on PATH) and blocks until it ends.
     * @param timeout Zero disables the timeout. Ignored without spawn support.
     * @param cancelled Polled while the child runs; ignored without spawn support.
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             const std::atomic<bool>* cancelled = nullptr);
};

} // namespace systemviz::infrastructure
