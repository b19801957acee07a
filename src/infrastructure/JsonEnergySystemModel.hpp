/**
 * @file JsonEnergySystemModel.hpp
 * @brief EnergySystemModel backed by a JSON dataset file.
 */

#pragma once

#include "domain/EnergySystemModel.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace systemviz::infrastructure {

/**
 * @class JsonEnergySystemModel
 * @brief Immutable, pre-indexed model instance; safe for concurrent reads.
 *
 * Dataset layout (keys other than `efficiency` are optional):
 * @code
 * {
 *   "name": "utopia",
 *   "periods": { "optimize": [1990, 2000], "horizon": [1990, 2000] },
 *   "seasons": ["winter"], "times_of_day": ["day"],
 *   "technologies": ["imp_coal"], "carriers": ["coal"], "emissions": ["co2"],
 *   "lifetimes": { "e_coal": 40 },
 *   "efficiency": [ { "input": "coal", "tech": "e_coal", "vintage": 1990, "output": "elc" } ],
 *   "results": {
 *     "capacity": [ { "tech": "e_coal", "vintage": 1990, "value": 1.5 } ],
 *     "capacity_available": [ { "period": 1990, "tech": "e_coal", "value": 1.5 } ],
 *     "flows": [ { "period": 1990, "season": "winter", "time_of_day": "day", "input": "coal",
 *                  "tech": "e_coal", "vintage": 1990, "output": "elc", "in": 3.0, "out": 1.0 } ],
 *     "emission_rates": [ { "emission": "co2", "input": "coal", "tech": "e_coal",
 *                           "vintage": 1990, "output": "elc", "rate": 0.1 } ]
 *   }
 * }
 * @endcode
 */
class JsonEnergySystemModel : public domain::EnergySystemModel {
public:
    /**
     * @brief Loads and indexes a dataset file.
     * @return nullopt if the file is missing or malformed (reason logged).
     */
    static std::optional<JsonEnergySystemModel> LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Builds a model from parsed JSON.
     * @param fallbackName Used when the document has no "name".
     * @throws nlohmann::json::exception / std::invalid_argument on malformed data.
     */
    static JsonEnergySystemModel FromJson(const nlohmann::json& j, const std::string& fallbackName);

    std::string name() const override { return m_name; }

    std::vector<std::string> technologies() const override { return m_technologies; }
    std::vector<std::string> physicalCarriers() const override { return m_carriers; }
    std::vector<std::string> emissionCommodities() const override { return m_emissions; }
    std::vector<int> optimizationPeriods() const override { return m_optimizePeriods; }
    std::vector<int> horizonPeriods() const override { return m_horizonPeriods; }
    std::vector<std::string> seasons() const override { return m_seasons; }
    std::vector<std::string> timesOfDay() const override { return m_timesOfDay; }

    std::vector<domain::ProcessKey> activeProcesses() const override;
    std::vector<std::string> processInputs(const domain::ProcessKey& process) const override;
    std::vector<std::string> processOutputs(const domain::ProcessKey& process) const override;
    std::vector<std::string> processOutputsByInput(const domain::ProcessKey& process,
                                                   const std::string& input) const override;
    std::vector<domain::TechVintage> processesByInput(const std::string& carrier) const override;
    std::vector<domain::TechVintage> processesByOutput(const std::string& carrier) const override;
    std::vector<int> processVintages(int period, const std::string& tech) const override;
    bool validActivity(int period, const std::string& tech, int vintage) const override;

    bool hasResults() const override { return m_hasResults; }
    double vintageCapacity(const std::string& tech, int vintage) const override;
    std::optional<double> capacityAvailable(int period, const std::string& tech) const override;
    double activity(int period, const std::string& tech, int vintage) const override;
    double flowIn(const domain::FlowKey& key) const override;
    double flowOut(const domain::FlowKey& key) const override;
    double energyConsumption(int period, const std::string& input, const std::string& tech) const override;
    double activityByOutput(int period, const std::string& tech, const std::string& output) const override;
    std::vector<domain::EmissionKey> emissionActivityKeys() const override;
    double emissionActivity(const std::string& emission, int period, const std::string& tech) const override;

private:
    using PeriodTech = std::pair<int, std::string>;
    using PeriodTechVintage = std::tuple<int, std::string, int>;
    using PeriodNameName = std::tuple<int, std::string, std::string>;
    using NamePeriodName = std::tuple<std::string, int, std::string>;

    void loadResults(const nlohmann::json& results);
    void deriveEmissionActivity();

    std::string m_name;
    std::vector<std::string> m_technologies;
    std::vector<std::string> m_carriers;
    std::vector<std::string> m_emissions;
    std::vector<int> m_optimizePeriods;
    std::vector<int> m_horizonPeriods;
    std::vector<std::string> m_seasons;
    std::vector<std::string> m_timesOfDay;

    /// process -> input -> outputs
    std::map<domain::ProcessKey, std::map<std::string, std::set<std::string>>> m_processFlows;
    std::map<std::string, std::set<domain::TechVintage>> m_byInput;
    std::map<std::string, std::set<domain::TechVintage>> m_byOutput;

    bool m_hasResults = false;
    std::map<domain::TechVintage, double> m_capacity;
    std::map<PeriodTech, double> m_capacityAvailable;
    std::map<domain::FlowKey, std::pair<double, double>> m_flows; ///< (in, out)
    std::map<PeriodTechVintage, double> m_activity;
    std::map<PeriodNameName, double> m_consumption;    ///< (period, input, tech)
    std::map<PeriodNameName, double> m_outputActivity; ///< (period, tech, output)
    std::map<domain::EmissionKey, double> m_emissionRates;
    std::map<NamePeriodName, double> m_emissionActivity; ///< (emission, period, tech)
};

} // namespace systemviz::infrastructure
