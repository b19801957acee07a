#include "application/jobs/ModelDiagramJobs.hpp"
#include "domain/DotDocument.hpp"
#include "domain/GraphSet.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <vector>

namespace systemviz::application {

using domain::AttributeList;
using domain::DotDocument;
using domain::EdgeSet;
using domain::NodeSet;

namespace {

const char* kDummyLabel = "   ";

std::string Href(const std::string& target) {
    return AttributeList().add("href", target).str();
}

std::vector<domain::ProcessKey> ProcessesOf(const domain::EnergySystemModel& model, const std::string& tech) {
    std::vector<domain::ProcessKey> processes = model.activeProcesses();
    processes.erase(std::remove_if(processes.begin(), processes.end(),
                                   [&](const domain::ProcessKey& p) { return p.tech != tech; }),
                    processes.end());
    return processes;
}

// Node and edge groups shared by the whole-system and main-model diagrams.
void AppendTechsAndCarriers(DotDocument& doc, const domain::RenderConfig& config,
                            const NodeSet& techs, const NodeSet& carriers,
                            const EdgeSet& inputs, const EdgeSet& outputs) {
    const auto& palette = config.palette;

    doc.comment("Define individual nodes");
    doc.beginSubgraph("techs")
        .nodeDefaults(AttributeList().add("color", palette.tech).add("shape", "box"))
        .blankLine()
        .nodes(techs)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("energy_carriers")
        .nodeDefaults(AttributeList().add("color", palette.commodity).add("shape", "circle"))
        .blankLine()
        .nodes(carriers)
        .endSubgraph()
        .blankLine();

    doc.comment("Define edges and any specific edge attributes");
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

} // namespace

std::optional<Artifact> SystemOverviewJob::compose(const domain::EnergySystemModel& model,
                                                   const domain::RenderConfig& config) const {
    NodeSet techs, carriers;
    EdgeSet inputs, outputs;

    for (const auto& process : model.activeProcesses()) {
        const std::string node = std::to_string(process.period) + ", " + process.tech + ", " +
                                 std::to_string(process.vintage);
        techs.addNode(node);
        for (const auto& input : model.processInputs(process)) {
            carriers.addNode(input);
            inputs.addEdge(input, node);
        }
        for (const auto& output : model.processOutputs(process)) {
            carriers.addNode(output);
            outputs.addEdge(node, output);
        }
    }

    if (techs.empty()) {
        return std::nullopt;
    }

    DotDocument doc("energy_system", "Every active process of every period, one node per (period, tech, vintage).");
    doc.attribute("rankdir", "LR")
        .blankLine()
        .nodeDefaults(AttributeList().add("style", "filled"))
        .edgeDefaults(AttributeList().add("arrowhead", "vee").add("label", kDummyLabel))
        .blankLine();
    AppendTechsAndCarriers(doc, config, techs, carriers, inputs, outputs);

    return Artifact{"all_vintages_model", doc.str()};
}

std::optional<Artifact> MainModelJob::compose(const domain::EnergySystemModel& model,
                                              const domain::RenderConfig& config) const {
    NodeSet techs, carriers;
    EdgeSet inputs, outputs;

    for (const auto& process : model.activeProcesses()) {
        techs.addNode(process.tech, Href(Image("processes/process_" + process.tech, config)));
        for (const auto& input : model.processInputs(process)) {
            carriers.addNode(input, Href(Image("commodities/commodity_" + input, config)));
            for (const auto& output : model.processOutputsByInput(process, input)) {
                carriers.addNode(output, Href(Image("commodities/commodity_" + output, config)));
                inputs.addEdge(input, process.tech);
                outputs.addEdge(process.tech, output);
            }
        }
    }

    if (techs.empty()) {
        return std::nullopt;
    }

    DotDocument doc("model", "Main model diagram: technologies and the carriers they convert.");
    doc.attribute("rankdir", "LR")
        .blankLine()
        .comment("Default node and edge attributes")
        .nodeDefaults(AttributeList().add("style", "filled"))
        .edgeDefaults(AttributeList().add("arrowhead", "vee").add("labelfontcolor", "lightgreen"))
        .blankLine();
    AppendTechsAndCarriers(doc, config, techs, carriers, inputs, outputs);

    return Artifact{"simple_model", doc.str()};
}

std::optional<Artifact> CommodityGraphJob::compose(const domain::EnergySystemModel& model,
                                                   const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    NodeSet carrierNodes, techs;
    EdgeSet inputs, outputs;

    carrierNodes.addNode(m_carrier, Href(Image("../simple_model", config)));
    for (const auto& [tech, vintage] : model.processesByInput(m_carrier)) {
        techs.addNode(tech, Href(Image("../processes/process_" + tech, config)));
        inputs.addEdge(m_carrier, tech);
    }
    for (const auto& [tech, vintage] : model.processesByOutput(m_carrier)) {
        techs.addNode(tech, Href(Image("../processes/process_" + tech, config)));
        outputs.addEdge(tech, m_carrier);
    }

    if (techs.empty()) {
        return std::nullopt;
    }

    DotDocument doc("energy_carrier", "Flow of energy via the carrier '" + m_carrier + "'.");
    doc.attribute("label", m_carrier)
        .blankLine()
        .attribute("color", "black")
        .attribute("compound", "true")
        .attribute("concentrate", "true")
        .attribute("rankdir", "LR")
        .attribute("splines", config.splines)
        .blankLine()
        .nodeDefaults(AttributeList().add("style", "filled"))
        .edgeDefaults(AttributeList()
                          .add("arrowhead", "vee")
                          .add("fontsize", "8")
                          .add("label", kDummyLabel)
                          .add("labelfloat", "false")
                          .add("len", "2")
                          .add("weight", "0.5"))
        .blankLine();

    doc.beginSubgraph("techs")
        .nodeDefaults(AttributeList().add("color", palette.tech).add("shape", "box"))
        .blankLine()
        .nodes(techs)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("energy_carriers")
        .nodeDefaults(AttributeList().add("color", palette.commodity).add("shape", "circle"))
        .blankLine()
        .nodes(carrierNodes)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("outputs")
        .edgeDefaults(AttributeList().add("color", palette.outputArrow))
        .blankLine()
        .edges(outputs)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("inputs")
        .edgeDefaults(AttributeList().add("color", palette.inputArrow))
        .blankLine()
        .edges(inputs)
        .endSubgraph();

    return Artifact{"commodities/commodity_" + m_carrier, doc.str()};
}

std::optional<Artifact> ProcessGraphJob::compose(const domain::EnergySystemModel& model,
                                                 const domain::RenderConfig& config) const {
    if (config.processLayout == domain::ProcessLayout::ExplicitVintages) {
        return composeExplicit(model, config);
    }
    return composeSeparate(model, config);
}

std::optional<Artifact> ProcessGraphJob::composeSeparate(const domain::EnergySystemModel& model,
                                                         const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    const std::vector<domain::ProcessKey> processes = ProcessesOf(model, m_tech);
    if (processes.empty()) {
        // Declared technology that no efficiency row uses.
        return std::nullopt;
    }

    std::set<int> periods, vintages;
    for (const auto& process : processes) {
        periods.insert(process.period);
        vintages.insert(process.vintage);
    }
    // All external edges meet the clusters at their middle member.
    const int midPeriod = *std::next(periods.begin(), static_cast<long>(periods.size() / 2));
    const int midVintage = *std::next(vintages.begin(), static_cast<long>(vintages.size() / 2));
    const std::string midVintageNode = "v_" + std::to_string(midVintage);
    const std::string midPeriodNode = "p_" + std::to_string(midPeriod);

    const bool showCapacity = config.showCapacity && model.hasResults();
    const std::string inputEdgeAttrs =
        AttributeList().add("color", palette.inputArrow).add("lhead", "cluster_vintage").str();
    const std::string outputEdgeAttrs =
        AttributeList().add("color", palette.outputArrow).add("ltail", "cluster_period").str();

    NodeSet inputNodes, outputNodes, periodNodes, vintageNodes;
    EdgeSet externalEdges, vintageEdges;
    size_t colorIndex = 0;

    for (const auto& process : processes) {
        const std::string periodNode = "p_" + std::to_string(process.period);
        const std::string vintageNode = "v_" + std::to_string(process.vintage);
        if (showCapacity) {
            const double total = model.capacityAvailable(process.period, m_tech).value_or(0.0);
            periodNodes.addNode(periodNode, AttributeList()
                .add("label", "p" + std::to_string(process.period) + "\\nTotal Capacity: " + Amount(total)).str());
            vintageNodes.addNode(vintageNode, AttributeList()
                .add("label", "v" + std::to_string(process.vintage) + "\\nCapacity: " +
                                  Amount(model.vintageCapacity(m_tech, process.vintage))).str());
        } else {
            periodNodes.addNode(periodNode);
            vintageNodes.addNode(vintageNode);
        }

        for (const auto& input : model.processInputs(process)) {
            for (const auto& output : model.processOutputsByInput(process, input)) {
                std::string rainbow = palette.flowArrow;
                if (!palette.rainbow.empty()) {
                    rainbow = palette.rainbow[colorIndex];
                    colorIndex = (colorIndex + 1) % palette.rainbow.size();
                }

                inputNodes.addNode(input, AttributeList()
                    .add("color", palette.incomingCommodity)
                    .add("href", Image("../commodities/commodity_" + input, config)).str());
                outputNodes.addNode(output, AttributeList()
                    .add("color", palette.outgoingCommodity)
                    .add("href", Image("../commodities/commodity_" + output, config)).str());
                externalEdges.addEdge(input, midVintageNode, inputEdgeAttrs);
                vintageEdges.addEdge(vintageNode, periodNode, AttributeList().add("color", rainbow).str());
                externalEdges.addEdge(midPeriodNode, output, outputEdgeAttrs);
            }
        }
    }

    const std::string clusterUrl = Image("../simple_model", config);

    DotDocument doc("model", "Vintages and periods of the technology '" + m_tech + "'.");
    doc.attribute("label", m_tech)
        .blankLine()
        .attribute("bgcolor", "transparent")
        .attribute("color", "black")
        .attribute("compound", "true")
        .attribute("concentrate", "true")
        .attribute("rankdir", "LR")
        .attribute("splines", config.splines)
        .blankLine()
        .nodeDefaults(AttributeList().add("shape", "box").add("style", "filled"))
        .edgeDefaults(AttributeList()
                          .add("arrowhead", "vee")
                          .add("decorate", "true")
                          .add("dir", "both")
                          .add("fontsize", "8")
                          .add("label", kDummyLabel)
                          .add("labelfloat", "false")
                          .add("labelfontcolor", "lightgreen")
                          .add("len", "2")
                          .add("weight", "0.5"))
        .blankLine();

    doc.beginSubgraph("cluster_vintage")
        .attribute("label", "Vintages")
        .attribute("color", palette.clusterBackground)
        .attribute("style", "filled")
        .attribute("href", clusterUrl)
        .blankLine()
        .nodeDefaults(AttributeList().add("color", palette.clusterNode))
        .blankLine()
        .nodes(vintageNodes)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("cluster_period")
        .attribute("label", "Period")
        .attribute("color", palette.clusterBackground)
        .attribute("style", "filled")
        .attribute("href", clusterUrl)
        .blankLine()
        .nodeDefaults(AttributeList().add("color", palette.clusterNode))
        .blankLine()
        .nodes(periodNodes)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("energy_carriers")
        .nodeDefaults(AttributeList().add("shape", "circle"))
        .blankLine()
        .comment("Input nodes")
        .nodes(inputNodes)
        .blankLine()
        .comment("Output nodes")
        .nodes(outputNodes)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("external_edges")
        .edgeDefaults(AttributeList().add("arrowhead", "normal").add("dir", "forward"))
        .blankLine()
        .edges(externalEdges)
        .endSubgraph()
        .blankLine();
    doc.beginSubgraph("internal_edges")
        .comment("edges between vintages and periods")
        .edges(vintageEdges)
        .endSubgraph();

    return Artifact{"processes/process_" + m_tech, doc.str()};
}

std::optional<Artifact> ProcessGraphJob::composeExplicit(const domain::EnergySystemModel& model,
                                                         const domain::RenderConfig& config) const {
    const auto& palette = config.palette;
    const bool showCapacity = config.showCapacity && model.hasResults();

    NodeSet inputNodes, outputNodes, vintageNodes;
    EdgeSet edges;

    for (const auto& process : ProcessesOf(model, m_tech)) {
        const std::string vintageNode = "p" + std::to_string(process.period) + "_v" + std::to_string(process.vintage);

        AttributeList vintageAttrs;
        vintageAttrs.add("color", palette.tech);
        if (showCapacity) {
            vintageAttrs.add("label", vintageNode + "\\nCapacity = " +
                                          Amount(model.vintageCapacity(m_tech, process.vintage)));
        }
        vintageAttrs.add("href", Image("../simple_model", config));

        for (const auto& input : model.processInputs(process)) {
            for (const auto& output : model.processOutputsByInput(process, input)) {
                inputNodes.addNode(input, AttributeList()
                    .add("color", palette.commodity)
                    .add("href", Image("../commodities/commodity_" + input, config)).str());
                outputNodes.addNode(output, AttributeList()
                    .add("color", palette.commodity)
                    .add("href", Image("../commodities/commodity_" + output, config)).str());
                vintageNodes.addNode(vintageNode, vintageAttrs.str());

                edges.addEdge(input, vintageNode,
                              AttributeList().add("color", palette.inputArrow).add("sametail", input).str());
                edges.addEdge(vintageNode, output,
                              AttributeList().add("color", palette.outputArrow).add("samehead", output).str());
            }
        }
    }

    if (vintageNodes.empty() || edges.empty()) {
        return std::nullopt;
    }

    DotDocument doc("model", "Explicit (period, vintage) layout of the technology '" + m_tech + "'.");
    doc.attribute("label", m_tech)
        .blankLine()
        .attribute("color", "black")
        .attribute("concentrate", "true")
        .attribute("rankdir", "LR")
        .blankLine()
        .nodeDefaults(AttributeList().add("shape", "box").add("style", "filled"))
        .edgeDefaults(AttributeList()
                          .add("arrowhead", "vee")
                          .add("decorate", "true")
                          .add("label", kDummyLabel)
                          .add("labelfontcolor", "lightgreen"))
        .blankLine();

    doc.beginSubgraph("energy_carriers")
        .nodeDefaults(AttributeList().add("shape", "circle"))
        .blankLine()
        .comment("Input nodes")
        .nodes(inputNodes)
        .blankLine()
        .comment("Output nodes")
        .nodes(outputNodes)
        .endSubgraph()
        .blankLine();

    doc.comment("Vintage nodes")
        .nodes(vintageNodes)
        .blankLine()
        .comment("Define edges and any specific edge attributes")
        .edges(edges);

    return Artifact{"processes/process_" + m_tech, doc.str()};
}

} // namespace systemviz::application
