/**
 * @file EnergySystemModel.hpp
 * @brief Read-only query surface over an energy system model instance.
 *
 * This is the only coupling point between diagram generation and the model
 * that computes processes, capacities and flows. Implementations must be safe
 * to query concurrently from several diagram jobs.
 */

#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace systemviz::domain {

/**
 * @struct ProcessKey
 * @brief One process: a technology of a given vintage, active in a period.
 */
struct ProcessKey {
    int period = 0;
    std::string tech;
    int vintage = 0;

    bool operator<(const ProcessKey& other) const {
        return std::tie(period, tech, vintage) < std::tie(other.period, other.tech, other.vintage);
    }
    bool operator==(const ProcessKey& other) const {
        return period == other.period && tech == other.tech && vintage == other.vintage;
    }
};

/**
 * @struct FlowKey
 * @brief Index of a single flow variable.
 */
struct FlowKey {
    int period = 0;
    std::string season;
    std::string timeOfDay;
    std::string input;
    std::string tech;
    int vintage = 0;
    std::string output;

    bool operator<(const FlowKey& other) const {
        return std::tie(period, season, timeOfDay, input, tech, vintage, output) <
               std::tie(other.period, other.season, other.timeOfDay, other.input, other.tech,
                        other.vintage, other.output);
    }
};

/**
 * @struct EmissionKey
 * @brief Emission produced by a process converting @c input to @c output.
 */
struct EmissionKey {
    std::string emission;
    std::string input;
    std::string tech;
    int vintage = 0;
    std::string output;

    bool operator<(const EmissionKey& other) const {
        return std::tie(emission, input, tech, vintage, output) <
               std::tie(other.emission, other.input, other.tech, other.vintage, other.output);
    }
};

/** @brief (tech, vintage) pair returned by carrier lookups. */
using TechVintage = std::pair<std::string, int>;

/**
 * @class EnergySystemModel
 * @brief Abstract query interface. All returned collections are sorted.
 */
class EnergySystemModel {
public:
    virtual ~EnergySystemModel() = default;

    /** @brief Dataset name, used to derive the run directory. */
    virtual std::string name() const = 0;

    // Sets
    virtual std::vector<std::string> technologies() const = 0;
    virtual std::vector<std::string> physicalCarriers() const = 0;
    virtual std::vector<std::string> emissionCommodities() const = 0;
    virtual std::vector<int> optimizationPeriods() const = 0;
    virtual std::vector<int> horizonPeriods() const = 0;
    virtual std::vector<std::string> seasons() const = 0;
    virtual std::vector<std::string> timesOfDay() const = 0;

    // Structure
    virtual std::vector<ProcessKey> activeProcesses() const = 0;
    virtual std::vector<std::string> processInputs(const ProcessKey& process) const = 0;
    virtual std::vector<std::string> processOutputs(const ProcessKey& process) const = 0;
    virtual std::vector<std::string> processOutputsByInput(const ProcessKey& process,
                                                           const std::string& input) const = 0;
    /** @brief Processes (any period) consuming @p carrier. */
    virtual std::vector<TechVintage> processesByInput(const std::string& carrier) const = 0;
    /** @brief Processes (any period) producing @p carrier. */
    virtual std::vector<TechVintage> processesByOutput(const std::string& carrier) const = 0;
    virtual std::vector<int> processVintages(int period, const std::string& tech) const = 0;
    virtual bool validActivity(int period, const std::string& tech, int vintage) const = 0;

    // Results
    virtual bool hasResults() const = 0;
    virtual double vintageCapacity(const std::string& tech, int vintage) const = 0;
    /** @return nullopt when the (period, tech) pair is not indexed at all. */
    virtual std::optional<double> capacityAvailable(int period, const std::string& tech) const = 0;
    virtual double activity(int period, const std::string& tech, int vintage) const = 0;
    virtual double flowIn(const FlowKey& key) const = 0;
    virtual double flowOut(const FlowKey& key) const = 0;
    virtual double energyConsumption(int period, const std::string& input, const std::string& tech) const = 0;
    virtual double activityByOutput(int period, const std::string& tech, const std::string& output) const = 0;
    virtual std::vector<EmissionKey> emissionActivityKeys() const = 0;
    virtual double emissionActivity(const std::string& emission, int period, const std::string& tech) const = 0;
};

} // namespace systemviz::domain
