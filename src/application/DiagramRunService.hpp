/**
 * @file DiagramRunService.hpp
 * @brief One complete diagram run: refresh output, plan, dispatch, report.
 */

#pragma once

#include "application/DiagramDispatcher.hpp"
#include "domain/DiagramRenderer.hpp"
#include "domain/EnergySystemModel.hpp"
#include "domain/RenderConfig.hpp"
#include <string>

namespace systemviz::application {

/**
 * @class DiagramRunService
 * @brief Application entry point used by the CLI.
 *
 * The model, configuration and renderer must outlive the service.
 */
class DiagramRunService {
public:
    DiagramRunService(const domain::EnergySystemModel& model,
                      const domain::RenderConfig& config,
                      domain::DiagramRenderer& renderer);

    /**
     * @brief Prepares `<outputRoot>/<runName>` and runs every planned job.
     * @throws std::runtime_error if the run directory cannot be prepared; no job runs then.
     */
    BatchReport Run(const std::string& runName);

    /** @brief Forwards to the dispatcher; callable from another thread. */
    void Cancel() { m_dispatcher.Cancel(); }

    DiagramDispatcher& GetDispatcher() { return m_dispatcher; }

private:
    const domain::EnergySystemModel& m_model;
    const domain::RenderConfig& m_config;
    domain::DiagramRenderer& m_renderer;
    DiagramDispatcher m_dispatcher;
};

} // namespace systemviz::application
