/**
 * @file JsonEnergySystemModel.cpp
 * @brief Implementation of JsonEnergySystemModel.
 */

#include "infrastructure/JsonEnergySystemModel.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace systemviz::infrastructure {

namespace fs = std::filesystem;
using domain::EmissionKey;
using domain::FlowKey;
using domain::ProcessKey;
using domain::TechVintage;

namespace {

std::vector<std::string> SortedUnique(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

std::vector<int> SortedUnique(std::vector<int> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

template <typename T>
std::vector<T> OptionalList(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return {};
    return j.at(key).get<std::vector<T>>();
}

template <typename K, typename V>
V Lookup(const std::map<K, V>& map, const K& key) {
    auto it = map.find(key);
    return it == map.end() ? V{} : it->second;
}

} // namespace

std::optional<JsonEnergySystemModel> JsonEnergySystemModel::LoadFromFile(const fs::path& path) {
    if (!fs::exists(path)) {
        std::cerr << "[ModelLoader] Dataset not found: " << path.string() << std::endl;
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        auto model = FromJson(j, path.stem().string());
        std::cout << "[ModelLoader] Loaded '" << model.name() << "': "
                  << model.m_technologies.size() << " technologies, "
                  << model.m_processFlows.size() << " active processes"
                  << (model.m_hasResults ? ", with results" : "") << std::endl;
        return model;
    } catch (const std::exception& e) {
        std::cerr << "[ModelLoader] Error reading " << path.string() << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

JsonEnergySystemModel JsonEnergySystemModel::FromJson(const nlohmann::json& j, const std::string& fallbackName) {
    if (!j.is_object()) {
        throw std::invalid_argument("dataset must be a JSON object");
    }

    JsonEnergySystemModel model;
    model.m_name = j.contains("name") ? j.at("name").get<std::string>() : fallbackName;

    if (j.contains("periods")) {
        const auto& periods = j.at("periods");
        model.m_optimizePeriods = SortedUnique(OptionalList<int>(periods, "optimize"));
        model.m_horizonPeriods = periods.contains("horizon")
            ? SortedUnique(periods.at("horizon").get<std::vector<int>>())
            : model.m_optimizePeriods;
    }
    model.m_seasons = SortedUnique(OptionalList<std::string>(j, "seasons"));
    model.m_timesOfDay = SortedUnique(OptionalList<std::string>(j, "times_of_day"));
    model.m_carriers = SortedUnique(OptionalList<std::string>(j, "carriers"));
    model.m_emissions = SortedUnique(OptionalList<std::string>(j, "emissions"));

    std::map<std::string, int> lifetimes;
    if (j.contains("lifetimes")) {
        lifetimes = j.at("lifetimes").get<std::map<std::string, int>>();
    }

    std::vector<std::string> techs = OptionalList<std::string>(j, "technologies");
    if (!j.contains("efficiency") || !j.at("efficiency").is_array()) {
        throw std::invalid_argument("dataset needs an 'efficiency' array");
    }

    for (const auto& row : j.at("efficiency")) {
        const std::string input = row.at("input").get<std::string>();
        const std::string tech = row.at("tech").get<std::string>();
        const int vintage = row.at("vintage").get<int>();
        const std::string output = row.at("output").get<std::string>();
        if (input.empty() || tech.empty() || output.empty()) {
            throw std::invalid_argument("efficiency row with an empty name");
        }
        techs.push_back(tech);

        auto life = lifetimes.find(tech);
        for (int period : model.m_optimizePeriods) {
            if (vintage > period) continue;
            if (life != lifetimes.end() && period >= vintage + life->second) continue;
            model.m_processFlows[ProcessKey{period, tech, vintage}][input].insert(output);
            model.m_byInput[input].insert(TechVintage{tech, vintage});
            model.m_byOutput[output].insert(TechVintage{tech, vintage});
        }
    }
    model.m_technologies = SortedUnique(std::move(techs));

    if (j.contains("results")) {
        model.loadResults(j.at("results"));
    }
    return model;
}

void JsonEnergySystemModel::loadResults(const nlohmann::json& results) {
    m_hasResults = true;

    for (const auto& row : OptionalList<nlohmann::json>(results, "capacity")) {
        m_capacity[TechVintage{row.at("tech").get<std::string>(), row.at("vintage").get<int>()}] =
            row.at("value").get<double>();
    }
    for (const auto& row : OptionalList<nlohmann::json>(results, "capacity_available")) {
        m_capacityAvailable[PeriodTech{row.at("period").get<int>(), row.at("tech").get<std::string>()}] =
            row.at("value").get<double>();
    }
    for (const auto& row : OptionalList<nlohmann::json>(results, "flows")) {
        FlowKey key;
        key.period = row.at("period").get<int>();
        key.season = row.at("season").get<std::string>();
        key.timeOfDay = row.at("time_of_day").get<std::string>();
        key.input = row.at("input").get<std::string>();
        key.tech = row.at("tech").get<std::string>();
        key.vintage = row.at("vintage").get<int>();
        key.output = row.at("output").get<std::string>();
        const double in = row.value("in", 0.0);
        const double out = row.value("out", 0.0);

        auto& flow = m_flows[key];
        flow.first += in;
        flow.second += out;
        m_activity[PeriodTechVintage{key.period, key.tech, key.vintage}] += out;
        m_consumption[PeriodNameName{key.period, key.input, key.tech}] += in;
        m_outputActivity[PeriodNameName{key.period, key.tech, key.output}] += out;
    }
    for (const auto& row : OptionalList<nlohmann::json>(results, "emission_rates")) {
        EmissionKey key;
        key.emission = row.at("emission").get<std::string>();
        key.input = row.at("input").get<std::string>();
        key.tech = row.at("tech").get<std::string>();
        key.vintage = row.at("vintage").get<int>();
        key.output = row.at("output").get<std::string>();
        m_emissionRates[key] = row.at("rate").get<double>();
    }
    deriveEmissionActivity();
}

void JsonEnergySystemModel::deriveEmissionActivity() {
    for (const auto& [flowKey, flow] : m_flows) {
        for (const auto& [rateKey, rate] : m_emissionRates) {
            if (rateKey.input == flowKey.input && rateKey.tech == flowKey.tech &&
                rateKey.vintage == flowKey.vintage && rateKey.output == flowKey.output) {
                m_emissionActivity[NamePeriodName{rateKey.emission, flowKey.period, flowKey.tech}] +=
                    rate * flow.second;
            }
        }
    }
}

std::vector<ProcessKey> JsonEnergySystemModel::activeProcesses() const {
    std::vector<ProcessKey> out;
    out.reserve(m_processFlows.size());
    for (const auto& entry : m_processFlows) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> JsonEnergySystemModel::processInputs(const ProcessKey& process) const {
    std::vector<std::string> out;
    auto it = m_processFlows.find(process);
    if (it == m_processFlows.end()) return out;
    for (const auto& entry : it->second) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> JsonEnergySystemModel::processOutputs(const ProcessKey& process) const {
    std::set<std::string> outputs;
    auto it = m_processFlows.find(process);
    if (it != m_processFlows.end()) {
        for (const auto& entry : it->second) {
            outputs.insert(entry.second.begin(), entry.second.end());
        }
    }
    return {outputs.begin(), outputs.end()};
}

std::vector<std::string> JsonEnergySystemModel::processOutputsByInput(const ProcessKey& process,
                                                                      const std::string& input) const {
    auto it = m_processFlows.find(process);
    if (it == m_processFlows.end()) return {};
    auto byInput = it->second.find(input);
    if (byInput == it->second.end()) return {};
    return {byInput->second.begin(), byInput->second.end()};
}

std::vector<TechVintage> JsonEnergySystemModel::processesByInput(const std::string& carrier) const {
    auto it = m_byInput.find(carrier);
    if (it == m_byInput.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<TechVintage> JsonEnergySystemModel::processesByOutput(const std::string& carrier) const {
    auto it = m_byOutput.find(carrier);
    if (it == m_byOutput.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<int> JsonEnergySystemModel::processVintages(int period, const std::string& tech) const {
    std::vector<int> vintages;
    for (const auto& entry : m_processFlows) {
        if (entry.first.period == period && entry.first.tech == tech) {
            vintages.push_back(entry.first.vintage);
        }
    }
    return vintages;
}

bool JsonEnergySystemModel::validActivity(int period, const std::string& tech, int vintage) const {
    return m_processFlows.count(ProcessKey{period, tech, vintage}) > 0;
}

double JsonEnergySystemModel::vintageCapacity(const std::string& tech, int vintage) const {
    return Lookup(m_capacity, TechVintage{tech, vintage});
}

std::optional<double> JsonEnergySystemModel::capacityAvailable(int period, const std::string& tech) const {
    auto it = m_capacityAvailable.find(PeriodTech{period, tech});
    if (it == m_capacityAvailable.end()) return std::nullopt;
    return it->second;
}

double JsonEnergySystemModel::activity(int period, const std::string& tech, int vintage) const {
    return Lookup(m_activity, PeriodTechVintage{period, tech, vintage});
}

double JsonEnergySystemModel::flowIn(const FlowKey& key) const {
    auto it = m_flows.find(key);
    return it == m_flows.end() ? 0.0 : it->second.first;
}

double JsonEnergySystemModel::flowOut(const FlowKey& key) const {
    auto it = m_flows.find(key);
    return it == m_flows.end() ? 0.0 : it->second.second;
}

double JsonEnergySystemModel::energyConsumption(int period, const std::string& input, const std::string& tech) const {
    return Lookup(m_consumption, PeriodNameName{period, input, tech});
}

double JsonEnergySystemModel::activityByOutput(int period, const std::string& tech, const std::string& output) const {
    return Lookup(m_outputActivity, PeriodNameName{period, tech, output});
}

std::vector<EmissionKey> JsonEnergySystemModel::emissionActivityKeys() const {
    std::vector<EmissionKey> keys;
    keys.reserve(m_emissionRates.size());
    for (const auto& entry : m_emissionRates) {
        keys.push_back(entry.first);
    }
    return keys;
}

double JsonEnergySystemModel::emissionActivity(const std::string& emission, int period, const std::string& tech) const {
    return Lookup(m_emissionActivity, NamePeriodName{emission, period, tech});
}

} // namespace systemviz::infrastructure
