/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner.
 */

#include "infrastructure/ProcessRunner.hpp"

#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#if defined(_WIN32)
#define SYSTEMVIZ_HAS_SPAWN 0
#else
#define SYSTEMVIZ_HAS_SPAWN 1
#include <cerrno>
#include <csignal>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace systemviz::infrastructure {

namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

#if SYSTEMVIZ_HAS_SPAWN
void KillAndReap(pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}
#endif

} // namespace

bool ProcessRunner::SupportsSpawn() {
    return SYSTEMVIZ_HAS_SPAWN != 0;
}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout,
                                 const std::atomic<bool>* cancelled) {
    ProcessResult result;
    if (argv.empty()) {
        result.status = ProcessResult::Status::LaunchFailed;
        result.message = "empty command line";
        return result;
    }

#if SYSTEMVIZ_HAS_SPAWN
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
    if (rc != 0) {
        result.status = ProcessResult::Status::LaunchFailed;
        result.message = "cannot start " + argv[0] + ": " + std::strerror(rc);
        return result;
    }

    const auto start = std::chrono::steady_clock::now();
    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) break;
        if (waited == -1) {
            if (errno == EINTR) continue;
            result.status = ProcessResult::Status::LaunchFailed;
            result.message = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }

        if (cancelled && cancelled->load()) {
            KillAndReap(pid);
            result.status = ProcessResult::Status::Cancelled;
            result.message = argv[0] + " killed: batch cancelled";
            return result;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
            KillAndReap(pid);
            result.status = ProcessResult::Status::TimedOut;
            result.message = argv[0] + " killed after " + std::to_string(timeout.count()) + " ms";
            return result;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (WIFEXITED(status)) {
        result.status = ProcessResult::Status::Exited;
        result.exitCode = WEXITSTATUS(status);
        // glibc reports a failed exec as exit status 127 from the child.
        if (result.exitCode == 127) {
            result.message = "exit code 127 (command not found?)";
        }
    } else if (WIFSIGNALED(status)) {
        result.status = ProcessResult::Status::Signaled;
        result.exitCode = 128 + WTERMSIG(status);
        result.message = "terminated by signal " + std::to_string(WTERMSIG(status));
    }
    return result;
#else
    (void)timeout;
    (void)cancelled;
    std::stringstream cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd << " ";
        cmd << "\"" << argv[i] << "\"";
    }
    int code = std::system(cmd.str().c_str());
    if (code == -1) {
        result.status = ProcessResult::Status::LaunchFailed;
        result.message = "cannot start " + argv[0];
        return result;
    }
    result.status = ProcessResult::Status::Exited;
    result.exitCode = code;
    return result;
#endif
}

} // namespace systemviz::infrastructure
