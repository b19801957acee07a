/**
 * @file JobPlanner.hpp
 * @brief Enumerates the diagram jobs of one run.
 */

#pragma once

#include "application/DiagramJob.hpp"
#include <memory>
#include <vector>

namespace systemviz::application {

/**
 * @class JobPlanner
 * @brief Turns a model into the ordered list of jobs for every diagram family.
 *
 * Order is fixed: whole system, main model, carriers, technologies, then
 * (with results) technology results, flow segments, carrier results and
 * period results. Scopes inside a family are sorted.
 */
class JobPlanner {
public:
    static std::vector<std::unique_ptr<DiagramJob>> Plan(const domain::EnergySystemModel& model);
};

} // namespace systemviz::application
