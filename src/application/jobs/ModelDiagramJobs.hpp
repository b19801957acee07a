/**
 * @file ModelDiagramJobs.hpp
 * @brief Structural diagrams: whole system, main model, per carrier, per technology.
 *
 * These only need the model structure and are planned for every dataset.
 */

#pragma once

#include "application/DiagramJob.hpp"
#include <string>
#include <utility>

namespace systemviz::application {

/**
 * @class SystemOverviewJob
 * @brief `all_vintages_model`: one box per active process, one circle per carrier.
 */
class SystemOverviewJob : public DiagramJob {
public:
    std::string family() const override { return "system"; }
    std::string scopeKey() const override { return "all_vintages_model"; }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;
};

/**
 * @class MainModelJob
 * @brief `simple_model`: technologies and carriers, linked to their own diagrams.
 */
class MainModelJob : public DiagramJob {
public:
    std::string family() const override { return "model"; }
    std::string scopeKey() const override { return "simple_model"; }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;
};

/**
 * @class CommodityGraphJob
 * @brief `commodities/commodity_<carrier>`: producers and consumers of one carrier.
 */
class CommodityGraphJob : public DiagramJob {
public:
    explicit CommodityGraphJob(std::string carrier) : m_carrier(std::move(carrier)) {}

    std::string family() const override { return "commodity"; }
    std::string scopeKey() const override { return m_carrier; }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;

private:
    std::string m_carrier;
};

/**
 * @class ProcessGraphJob
 * @brief `processes/process_<tech>`: vintages and periods of one technology.
 *
 * Layout follows RenderConfig::processLayout.
 */
class ProcessGraphJob : public DiagramJob {
public:
    explicit ProcessGraphJob(std::string tech) : m_tech(std::move(tech)) {}

    std::string family() const override { return "process"; }
    std::string scopeKey() const override { return m_tech; }
    std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                    const domain::RenderConfig& config) const override;

private:
    std::optional<Artifact> composeSeparate(const domain::EnergySystemModel& model,
                                            const domain::RenderConfig& config) const;
    std::optional<Artifact> composeExplicit(const domain::EnergySystemModel& model,
                                            const domain::RenderConfig& config) const;

    std::string m_tech;
};

} // namespace systemviz::application
