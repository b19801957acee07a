/**
 * @file ResultsDiagramJobs.hpp
 * @brief Diagrams of solved results: capacities, flows and emissions.
 *
 * Planned only when the model carries results.
 */

#pragma once

#include "application/DiagramJob.hpp"
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace systemviz::application {

/**
 * @struct CarrierUsage
 * @brief Carriers and technologies touched by any non-zero input flow.
 *
 * Computed once per batch and shared read-only by the commodity result jobs.
 */
struct CarrierUsage {
    std::set<std::string> carriers;
    std::set<std::string> techs;

    static CarrierUsage Compute(const domain::EnergySystemModel& model);
};

/** @brief Sum of flow-in over every (season, time of day) slice. */
double TotalFlowIn(const domain::EnergySystemModel& model, int period, const std::string& input,
                   const std::string& tech, int vintage, const std::string& output);

/** @brief Sum of flow-out over every (season, time of day) slice. */
double TotalFlowOut(const domain::EnergySystemModel& model, int period, const std::string& input,
                    const std::string& tech, int vintage, const std::string& output);

/**
 * @class TechResultsJob
 * @brief `results/results_<tech>_<period>`: active vintages and their flows.
 */
class TechResultsJob : public DiagramJob {
public:
    TechResultsJob(int period, std::string tech) : m_period(period), m_tech(std::move(tech)) {}

    std::string family() const override { return "tech_results"; }
    std::string scopeKey() const override { return m_tech + "@" + std::to_string(m_period); }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;

private:
    int m_period;
    std::string m_tech;
};

/**
 * @class FlowSegmentsJob
 * @brief `results/results_<tech>_p<period>v<vintage>_segments`: flows per time slice.
 *
 * Slices whose input flow is zero or smaller in magnitude than the significance
 * threshold are left out; negative flows are drawn.
 */
class FlowSegmentsJob : public DiagramJob {
public:
    explicit FlowSegmentsJob(domain::ProcessKey process) : m_process(std::move(process)) {}

    std::string family() const override { return "segments"; }
    std::string scopeKey() const override;
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;

private:
    domain::ProcessKey m_process;
};

/**
 * @class CommodityResultsJob
 * @brief `commodities/rc_<carrier>_<period>`: used versus unused techs around a carrier.
 */
class CommodityResultsJob : public DiagramJob {
public:
    CommodityResultsJob(std::string carrier, int period, std::shared_ptr<const CarrierUsage> usage)
        : m_carrier(std::move(carrier)), m_period(period), m_usage(std::move(usage)) {}

    std::string family() const override { return "commodity_results"; }
    std::string scopeKey() const override { return m_carrier + "@" + std::to_string(m_period); }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;

private:
    std::string m_carrier;
    int m_period;
    std::shared_ptr<const CarrierUsage> m_usage;
};

/**
 * @class PeriodResultsJob
 * @brief `results/results<period>`: the whole system for one optimization period.
 */
class PeriodResultsJob : public DiagramJob {
public:
    explicit PeriodResultsJob(int period) : m_period(period) {}

    std::string family() const override { return "period_results"; }
    std::string scopeKey() const override { return std::to_string(m_period); }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;

private:
    int m_period;
};

} // namespace systemviz::application
