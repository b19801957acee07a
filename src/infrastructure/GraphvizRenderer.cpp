#include "infrastructure/GraphvizRenderer.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <iostream>
#include <vector>

namespace systemviz::infrastructure {

GraphvizRenderer::GraphvizRenderer(const std::string& executable, std::chrono::seconds timeout)
    : m_executable(executable)
    , m_timeout(timeout)
{}

domain::RenderResult GraphvizRenderer::render(const domain::RenderRequest& request,
                                              const std::atomic<bool>* cancelled) {
    // dot -Tsvg -o<image> <artifact>
    std::vector<std::string> argv = {
        m_executable,
        "-T" + request.format,
        "-o" + request.outputPath.string(),
        request.inputPath.string()
    };

    ProcessResult process = ProcessRunner::Run(
        argv, std::chrono::duration_cast<std::chrono::milliseconds>(m_timeout), cancelled);

    domain::RenderResult result;
    result.exitCode = process.exitCode;
    switch (process.status) {
        case ProcessResult::Status::Exited:
            if (process.exitCode == 0) {
                result.status = domain::RenderResult::Status::Succeeded;
            } else {
                result.status = domain::RenderResult::Status::Failed;
                result.message = m_executable + " exited with code " + std::to_string(process.exitCode);
                if (!process.message.empty()) result.message += " - " + process.message;
            }
            break;
        case ProcessResult::Status::Signaled:
            result.status = domain::RenderResult::Status::Failed;
            result.message = m_executable + " " + process.message;
            break;
        case ProcessResult::Status::LaunchFailed:
            result.status = domain::RenderResult::Status::LaunchFailed;
            result.message = process.message;
            break;
        case ProcessResult::Status::TimedOut:
            result.status = domain::RenderResult::Status::TimedOut;
            result.message = process.message;
            break;
        case ProcessResult::Status::Cancelled:
            result.status = domain::RenderResult::Status::Cancelled;
            result.message = process.message;
            break;
    }

    if (!result.ok()) {
        std::cerr << "[Renderer] " << request.inputPath.filename().string() << ": " << result.message << std::endl;
    }
    return result;
}

} // namespace systemviz::infrastructure
