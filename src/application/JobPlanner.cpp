#include "application/JobPlanner.hpp"
#include "application/jobs/ModelDiagramJobs.hpp"
#include "application/jobs/ResultsDiagramJobs.hpp"

#include <set>
#include <string>

namespace systemviz::application {

std::vector<std::unique_ptr<DiagramJob>> JobPlanner::Plan(const domain::EnergySystemModel& model) {
    std::vector<std::unique_ptr<DiagramJob>> jobs;
    const std::vector<domain::ProcessKey> processes = model.activeProcesses();

    jobs.push_back(std::make_unique<SystemOverviewJob>());
    jobs.push_back(std::make_unique<MainModelJob>());

    std::set<std::string> carriers;
    for (const auto& process : processes) {
        for (const auto& input : model.processInputs(process)) carriers.insert(input);
        for (const auto& output : model.processOutputs(process)) carriers.insert(output);
    }
    for (const auto& carrier : carriers) {
        jobs.push_back(std::make_unique<CommodityGraphJob>(carrier));
    }

    for (const auto& tech : model.technologies()) {
        jobs.push_back(std::make_unique<ProcessGraphJob>(tech));
    }

    if (!model.hasResults()) {
        return jobs;
    }

    for (int period : model.optimizationPeriods()) {
        for (const auto& tech : model.technologies()) {
            std::optional<double> capacity = model.capacityAvailable(period, tech);
            if (capacity && *capacity > 0.0) {
                jobs.push_back(std::make_unique<TechResultsJob>(period, tech));
            }
        }
    }

    for (const auto& process : processes) {
        jobs.push_back(std::make_unique<FlowSegmentsJob>(process));
    }

    auto usage = std::make_shared<const CarrierUsage>(CarrierUsage::Compute(model));
    for (int period : model.horizonPeriods()) {
        for (const auto& carrier : usage->carriers) {
            jobs.push_back(std::make_unique<CommodityResultsJob>(carrier, period, usage));
        }
    }

    for (int period : model.optimizationPeriods()) {
        jobs.push_back(std::make_unique<PeriodResultsJob>(period));
    }
    return jobs;
}

} // namespace systemviz::application
