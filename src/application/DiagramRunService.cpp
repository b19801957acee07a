#include "application/DiagramRunService.hpp"
#include "application/JobPlanner.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OutputDirectoryManager.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <iostream>

namespace systemviz::application {

namespace {

unsigned ResolveConcurrency(const domain::RenderConfig& config) {
    if (!infrastructure::ProcessRunner::SupportsSpawn()) {
        std::cerr << "[SystemViz] No process-spawn support on this platform, running jobs sequentially." << std::endl;
        return 1;
    }
    return infrastructure::ConfigLoader::EffectiveConcurrency(config);
}

} // namespace

DiagramRunService::DiagramRunService(const domain::EnergySystemModel& model,
                                     const domain::RenderConfig& config,
                                     domain::DiagramRenderer& renderer)
    : m_model(model)
    , m_config(config)
    , m_renderer(renderer)
    , m_dispatcher(ResolveConcurrency(config))
{}

BatchReport DiagramRunService::Run(const std::string& runName) {
    const std::filesystem::path runRoot = infrastructure::OutputDirectoryManager::Prepare(m_config.outputRoot, runName);

    std::vector<std::unique_ptr<DiagramJob>> jobs = JobPlanner::Plan(m_model);
    std::cout << "[SystemViz] Planned " << jobs.size() << " diagram jobs for '" << m_model.name()
              << "' into " << runRoot.string() << std::endl;

    JobContext context{m_model, m_config, m_renderer, runRoot, nullptr};
    return m_dispatcher.Run(jobs, context);
}

} // namespace systemviz::application
