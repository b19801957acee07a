#include "application/jobs/ResultsDiagramJobs.hpp"
#include "domain/DotDocument.hpp"
#include "domain/GraphSet.hpp"

#include <algorithm>
#include <cmath>

namespace systemviz::application {

using domain::AttributeList;
using domain::DotDocument;
using domain::EdgeSet;
using domain::NodeSet;

namespace {

std::string Href(const std::string& target) {
    return AttributeList().add("href", target).str();
}

std::string FlowLabel(const std::string& amount) {
    return AttributeList().add("label", amount).str();
}

AttributeList UsedNodeDefaults(const std::string& color, const std::string& fontColor, const char* shape) {
    return AttributeList().add("color", color).add("fontcolor", fontColor).add("shape", shape);
}

void AppendCarriersAndFlows(DotDocument& doc, const domain::RenderConfig& config,
                            const NodeSet& carriers, const EdgeSet& inputs, const EdgeSet& outputs) {
    const auto& palette = config.palette;
    doc.beginSubgraph("energy_carriers")
        .nodeDefaults(UsedNodeDefaults(palette.commodity, palette.usedFont, "circle"))
        .blankLine()
        .nodes(carriers)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("inputs")
        .edgeDefaults(AttributeList().add("color", palette.inputArrow))
        .blankLine()
        .edges(inputs)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("outputs")
        .edgeDefaults(AttributeList().add("color", palette.outputArrow))
        .blankLine()
        .edges(outputs)
        .endSubgraph();
}

void AppendResultsHeader(DotDocument& doc, const domain::RenderConfig& config, const std::string& label) {
    doc.attribute("label", label)
        .blankLine()
        .attribute("compound", "true")
        .attribute("concentrate", "true")
        .attribute("rankdir", "LR")
        .attribute("splines", config.splines)
        .blankLine()
        .nodeDefaults(AttributeList().add("style", "filled"))
        .edgeDefaults(AttributeList().add("arrowhead", "vee"))
        .blankLine();
}

} // namespace

double TotalFlowIn(const domain::EnergySystemModel& model, int period, const std::string& input,
                   const std::string& tech, int vintage, const std::string& output) {
    double total = 0.0;
    for (const auto& season : model.seasons()) {
        for (const auto& timeOfDay : model.timesOfDay()) {
            total += model.flowIn(domain::FlowKey{period, season, timeOfDay, input, tech, vintage, output});
        }
    }
    return total;
}

double TotalFlowOut(const domain::EnergySystemModel& model, int period, const std::string& input,
                    const std::string& tech, int vintage, const std::string& output) {
    double total = 0.0;
    for (const auto& season : model.seasons()) {
        for (const auto& timeOfDay : model.timesOfDay()) {
            total += model.flowOut(domain::FlowKey{period, season, timeOfDay, input, tech, vintage, output});
        }
    }
    return total;
}

CarrierUsage CarrierUsage::Compute(const domain::EnergySystemModel& model) {
    CarrierUsage usage;
    for (const auto& process : model.activeProcesses()) {
        bool used = false;
        for (const auto& input : model.processInputs(process)) {
            for (const auto& output : model.processOutputsByInput(process, input)) {
                if (TotalFlowIn(model, process.period, input, process.tech, process.vintage, output) != 0.0) {
                    used = true;
                }
            }
        }
        if (!used) continue;

        for (const auto& input : model.processInputs(process)) {
            usage.carriers.insert(input);
        }
        for (const auto& output : model.processOutputs(process)) {
            usage.carriers.insert(output);
        }
        usage.techs.insert(process.tech);
    }
    return usage;
}

std::optional<Artifact> TechResultsJob::compose(const domain::EnergySystemModel& model,
                                                const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    const double totalCapacity = model.capacityAvailable(m_period, m_tech).value_or(0.0);
    const std::string period = std::to_string(m_period);

    NodeSet carriers, vintages;
    EdgeSet inputs, outputs;

    for (int vintage : model.processVintages(m_period, m_tech)) {
        if (model.activity(m_period, m_tech, vintage) == 0.0) {
            continue;
        }

        const domain::ProcessKey process{m_period, m_tech, vintage};
        const std::string vintageNode = std::to_string(vintage);
        const std::string vintageAttrs = AttributeList()
            .add("href", Image("results_" + m_tech + "_p" + period + "v" + vintageNode + "_segments", config))
            .add("label", vintageNode + "\\nCap: " + Amount(model.vintageCapacity(m_tech, vintage)))
            .str();

        for (const auto& input : model.processInputs(process)) {
            for (const auto& output : model.processOutputsByInput(process, input)) {
                vintages.addNode(vintageNode, vintageAttrs);
                carriers.addNode(input, Href(Image("../commodities/rc_" + input + "_" + period, config)));
                carriers.addNode(output, Href(Image("../commodities/rc_" + output + "_" + period, config)));
                inputs.addEdge(input, vintageNode,
                               FlowLabel(Amount(TotalFlowIn(model, m_period, input, m_tech, vintage, output))));
                outputs.addEdge(vintageNode, output,
                                FlowLabel(Amount(TotalFlowOut(model, m_period, input, m_tech, vintage, output))));
            }
        }
    }

    if (vintages.empty()) {
        return std::nullopt;
    }

    DotDocument doc("model", "Results of the technology '" + m_tech + "' in " + period + ".");
    AppendResultsHeader(doc, config, "Results for " + m_tech + " in " + period);

    doc.beginSubgraph("cluster_vintages")
        .attribute("label", "Vintages\\nCapacity: " + Amount(totalCapacity))
        .blankLine()
        .attribute("href", Image("results" + period, config))
        .attribute("style", "filled")
        .attribute("color", palette.clusterBackground)
        .blankLine()
        .nodeDefaults(AttributeList().add("color", palette.clusterNode).add("shape", "box"))
        .blankLine()
        .nodes(vintages)
        .endSubgraph()
        .blankLine();
    AppendCarriersAndFlows(doc, config, carriers, inputs, outputs);

    return Artifact{"results/results_" + m_tech + "_" + period, doc.str()};
}

std::string FlowSegmentsJob::scopeKey() const {
    return m_process.tech + "@p" + std::to_string(m_process.period) + "v" + std::to_string(m_process.vintage);
}

std::optional<Artifact> FlowSegmentsJob::compose(const domain::EnergySystemModel& model,
                                                 const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    const int p = m_process.period;
    const std::string& t = m_process.tech;
    const int v = m_process.vintage;

    if (model.activity(p, t, v) == 0.0) {
        return std::nullopt;
    }

    const std::string period = std::to_string(p);
    NodeSet slices, carriers;
    EdgeSet inputs, outputs;

    for (const auto& input : model.processInputs(m_process)) {
        for (const auto& output : model.processOutputsByInput(m_process, input)) {
            for (const auto& season : model.seasons()) {
                for (const auto& timeOfDay : model.timesOfDay()) {
                    const domain::FlowKey key{p, season, timeOfDay, input, t, v, output};
                    const double flowIn = model.flowIn(key);
                    if (flowIn == 0.0 || std::fabs(flowIn) < config.significanceThreshold) {
                        continue;
                    }
                    const std::string slice = season + ", " + timeOfDay;
                    slices.addNode(slice);
                    carriers.addNode(input, Href(Image("../commodities/rc_" + input + "_" + period, config)));
                    carriers.addNode(output, Href(Image("../commodities/rc_" + output + "_" + period, config)));
                    inputs.addEdge(input, slice, FlowLabel(Amount(flowIn)));
                    outputs.addEdge(slice, output, FlowLabel(Amount(model.flowOut(key))));
                }
            }
        }
    }

    if (slices.empty()) {
        return std::nullopt;
    }

    const std::string vintage = std::to_string(v);
    const double totalCapacity = model.capacityAvailable(p, t).value_or(0.0);

    DotDocument doc("model", "Activity of the process (" + t + ", " + vintage + ") per time slice in " + period + ".");
    AppendResultsHeader(doc, config,
                        "Activity split of process " + t + ", " + vintage + " in year " + period);

    doc.beginSubgraph("cluster_slices")
        .attribute("label", vintage + " Capacity: " + Amount(totalCapacity))
        .blankLine()
        .attribute("color", palette.clusterBackground)
        .attribute("rank", "same")
        .attribute("style", "filled")
        .blankLine()
        .nodeDefaults(AttributeList().add("color", palette.clusterNode).add("shape", "box"))
        .blankLine()
        .nodes(slices)
        .endSubgraph()
        .blankLine();
    AppendCarriersAndFlows(doc, config, carriers, inputs, outputs);

    return Artifact{"results/results_" + t + "_p" + period + "v" + vintage + "_segments", doc.str()};
}

std::optional<Artifact> CommodityResultsJob::compose(const domain::EnergySystemModel& model,
                                                     const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    const std::string period = std::to_string(m_period);

    NodeSet carrierNode, usedTechs, unusedTechs;
    EdgeSet usedFlows, unusedFlows;

    carrierNode.addNode(m_carrier, AttributeList()
        .add("color", palette.commodity)
        .add("href", Image("../results/results" + period, config))
        .add("shape", "circle").str());

    for (const auto& [tech, vintage] : model.processesByInput(m_carrier)) {
        if (m_usage->techs.count(tech)) {
            usedTechs.addNode(tech, Href(Image("../results/results_" + tech + "_" + period, config)));
            usedFlows.addEdge(m_carrier, tech);
        } else {
            unusedTechs.addNode(tech);
            unusedFlows.addEdge(m_carrier, tech);
        }
    }
    for (const auto& [tech, vintage] : model.processesByOutput(m_carrier)) {
        if (m_usage->techs.count(tech)) {
            usedTechs.addNode(tech, Href(Image("../results/results_" + tech + "_" + period, config)));
            usedFlows.addEdge(tech, m_carrier);
        } else {
            unusedTechs.addNode(tech);
            unusedFlows.addEdge(tech, m_carrier);
        }
    }

    if (usedTechs.empty() && unusedTechs.empty()) {
        return std::nullopt;
    }

    DotDocument doc("result_commodity_" + m_carrier, "Use of the carrier '" + m_carrier + "' in " + period + ".");
    doc.attribute("label", m_carrier + " - " + period)
        .blankLine()
        .attribute("compound", "true")
        .attribute("concentrate", "true")
        .attribute("rankdir", "LR")
        .attribute("splines", config.splines)
        .blankLine()
        .nodeDefaults(AttributeList().add("shape", "box").add("style", "filled"))
        .edgeDefaults(AttributeList()
                          .add("arrowhead", "vee")
                          .add("fontsize", "8")
                          .add("label", "   ")
                          .add("labelfloat", "false")
                          .add("labelfontcolor", "lightgreen")
                          .add("len", "2")
                          .add("weight", "0.5"))
        .blankLine()
        .nodes(carrierNode)
        .blankLine();

    doc.beginSubgraph("used_techs")
        .nodeDefaults(AttributeList().add("color", palette.tech))
        .blankLine()
        .nodes(usedTechs)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("unused_techs")
        .nodeDefaults(AttributeList().add("color", palette.unused))
        .blankLine()
        .nodes(unusedTechs)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("in_use_flows")
        .edgeDefaults(AttributeList().add("color", palette.flowArrow))
        .blankLine()
        .edges(usedFlows)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("unused_flows")
        .edgeDefaults(AttributeList().add("color", palette.unused))
        .blankLine()
        .edges(unusedFlows)
        .endSubgraph();

    return Artifact{"commodities/rc_" + m_carrier + "_" + period, doc.str()};
}

std::optional<Artifact> PeriodResultsJob::compose(const domain::EnergySystemModel& model,
                                                  const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    const double epsilon = config.significanceThreshold;
    const std::string period = std::to_string(m_period);

    NodeSet usedTechs, unusedTechs, usedCarriers, unusedCarriers, usedEmissions, unusedEmissions;
    EdgeSet inputFlows, outputFlows, unusedFlows;
    std::set<std::string> carriersSeen, emissionsSeen;

    for (const auto& tech : model.technologies()) {
        const std::optional<double> capacity = model.capacityAvailable(m_period, tech);
        if (!capacity) {
            continue;
        }

        if (*capacity != 0.0) {
            usedTechs.addNode(tech, AttributeList()
                .add("label", tech + "\\nCapacity: " + Amount(*capacity))
                .add("href", Image("results_" + tech + "_" + period, config)).str());
        } else {
            unusedTechs.addNode(tech);
        }

        for (int vintage : model.processVintages(m_period, tech)) {
            const domain::ProcessKey process{m_period, tech, vintage};
            for (const auto& input : model.processInputs(process)) {
                const double amount = model.energyConsumption(m_period, input, tech);
                if (amount >= epsilon) {
                    inputFlows.addEdge(input, tech, FlowLabel(Amount(amount)));
                    usedCarriers.addNode(input, Href(Image("../commodities/rc_" + input + "_" + period, config)));
                    carriersSeen.insert(input);
                } else {
                    unusedFlows.addEdge(input, tech);
                }
            }
            for (const auto& output : model.processOutputs(process)) {
                const double amount = model.activityByOutput(m_period, tech, output);
                if (amount >= epsilon) {
                    outputFlows.addEdge(tech, output, FlowLabel(Amount(amount)));
                    usedCarriers.addNode(output, Href(Image("../commodities/rc_" + output + "_" + period, config)));
                    carriersSeen.insert(output);
                } else {
                    unusedFlows.addEdge(tech, output);
                }
            }
        }
    }

    for (const auto& key : model.emissionActivityKeys()) {
        if (!model.validActivity(m_period, key.tech, key.vintage)) {
            continue;
        }
        const double amount = model.emissionActivity(key.emission, m_period, key.tech);
        if (amount < epsilon) {
            continue;
        }
        outputFlows.addEdge(key.tech, key.emission, FlowLabel(Amount(amount)));
        usedEmissions.addNode(key.emission);
        emissionsSeen.insert(key.emission);
    }

    if (usedTechs.empty() && unusedTechs.empty()) {
        return std::nullopt;
    }

    for (const auto& carrier : model.physicalCarriers()) {
        if (!carriersSeen.count(carrier)) unusedCarriers.addNode(carrier);
    }
    for (const auto& emission : model.emissionCommodities()) {
        if (!emissionsSeen.count(emission)) unusedEmissions.addNode(emission);
    }

    DotDocument doc("model", "Results of every technology in " + period + ".");
    doc.attribute("label", "Results for " + period)
        .blankLine()
        .attribute("rankdir", "LR")
        .attribute("smoothtype", "power_dist")
        .attribute("splines", config.splines)
        .blankLine()
        .nodeDefaults(AttributeList().add("style", "filled"))
        .edgeDefaults(AttributeList().add("arrowhead", "vee"))
        .blankLine();

    struct NodeGroup {
        const char* name;
        const NodeSet& nodes;
        AttributeList defaults;
    };
    const NodeGroup groups[] = {
        {"unused_techs", unusedTechs, UsedNodeDefaults(palette.unused, palette.unusedFont, "box")},
        {"unused_energy_carriers", unusedCarriers, UsedNodeDefaults(palette.unused, palette.unusedFont, "circle")},
        {"unused_emissions", unusedEmissions, UsedNodeDefaults(palette.unused, palette.unusedFont, "circle")},
        {"in_use_techs", usedTechs, UsedNodeDefaults(palette.tech, palette.usedFont, "box")},
        {"in_use_energy_carriers", usedCarriers, UsedNodeDefaults(palette.commodity, palette.usedFont, "circle")},
        {"in_use_emissions", usedEmissions, UsedNodeDefaults(palette.commodity, palette.usedFont, "circle")},
    };
    for (const auto& group : groups) {
        doc.beginSubgraph(group.name)
            .nodeDefaults(group.defaults)
            .blankLine()
            .nodes(group.nodes)
            .endSubgraph()
            .blankLine();
    }

    doc.beginSubgraph("unused_flows")
        .edgeDefaults(AttributeList().add("color", palette.unused))
        .blankLine()
        .edges(unusedFlows)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("in_use_flows")
        .beginSubgraph("inputs")
        .edgeDefaults(AttributeList().add("color", palette.inputArrow))
        .blankLine()
        .edges(inputFlows)
        .endSubgraph()
        .blankLine()
        .beginSubgraph("outputs")
        .edgeDefaults(AttributeList().add("color", palette.outputArrow))
        .blankLine()
        .edges(outputFlows)
        .endSubgraph()
        .endSubgraph();

    return Artifact{"results/results" + period, doc.str()};
}

} // namespace systemviz::application
