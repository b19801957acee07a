#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/DotSerializer.hpp"
#include "domain/GraphSet.hpp"

using namespace systemviz::domain;

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

void TestDuplicatesCollapse() {
    NodeSet nodes;
    nodes.addNode("coal", "color=\"red\"");
    nodes.addNode("coal", "color=\"red\"");
    nodes.addNode("gas");
    nodes.addNode("gas");
    assert(nodes.size() == 2);
    assert(SplitLines(DotSerializer::RenderNodes(nodes)).size() == 2);

    EdgeSet edges;
    edges.addEdge("x", "y");
    edges.addEdge("x", "y");
    assert(edges.size() == 1);
    assert(DotSerializer::RenderEdges(edges) == "\"x\" -> \"y\" ;");
    std::cout << "[PASS] Duplicate entries render once." << std::endl;
}

void TestSameIdDifferentAttributesKeptApart() {
    NodeSet nodes;
    nodes.addNode("elc", "color=\"red\"");
    nodes.addNode("elc", "color=\"blue\"");
    assert(nodes.size() == 2);
    auto lines = SplitLines(DotSerializer::RenderNodes(nodes));
    assert(lines.size() == 2);
    assert(lines[0] == "\"elc\" [ color=\"blue\" ] ;");
    assert(lines[1] == "\t\"elc\" [ color=\"red\" ] ;");
    std::cout << "[PASS] Same id with different attributes renders twice." << std::endl;
}

void TestOrderIndependence() {
    NodeSet forward, backward;
    EdgeSet forwardEdges, backwardEdges;
    const std::vector<std::string> ids = {"imp_coal", "e_coal", "elc", "coal", "e_hydro"};

    for (size_t i = 0; i < ids.size(); ++i) {
        forward.addNode(ids[i], i % 2 ? std::optional<std::string>("shape=box") : std::nullopt);
        forwardEdges.addEdge(ids[i], ids[(i + 1) % ids.size()], i % 2 ? std::optional<std::string>("label=\"1.00\"") : std::nullopt);
    }
    for (size_t k = ids.size(); k-- > 0;) {
        backward.addNode(ids[k], k % 2 ? std::optional<std::string>("shape=box") : std::nullopt);
        backwardEdges.addEdge(ids[k], ids[(k + 1) % ids.size()], k % 2 ? std::optional<std::string>("label=\"1.00\"") : std::nullopt);
    }

    assert(DotSerializer::RenderNodes(forward, 2) == DotSerializer::RenderNodes(backward, 2));
    assert(DotSerializer::RenderEdges(forwardEdges, 2) == DotSerializer::RenderEdges(backwardEdges, 2));
    std::cout << "[PASS] Output does not depend on insertion order." << std::endl;
}

void TestEmptyPlaceholders() {
    NodeSet nodes;
    EdgeSet edges;
    assert(DotSerializer::RenderNodes(nodes) == "// no nodes in this section");
    assert(DotSerializer::RenderEdges(edges, 3) == "// no edges in this section");
    assert(!DotSerializer::RenderNodes(nodes).empty());
    std::cout << "[PASS] Empty sets render the placeholder comment." << std::endl;
}

void TestMixedNodeForms() {
    NodeSet nodes;
    nodes.addNode("A");
    nodes.addNode("B", "color=red");
    const std::string text = DotSerializer::RenderNodes(nodes);
    assert(text == "\"A\" ;\n\t\"B\" [ color=red ] ;");
    std::cout << "[PASS] Bare and attributed nodes use their own forms." << std::endl;
}

void TestNodeAlignment() {
    NodeSet nodes;
    nodes.addNode("a", "k=1");
    nodes.addNode("longer", "k=2");
    nodes.addNode("a_very_long_bare_identifier");

    auto lines = SplitLines(DotSerializer::RenderNodes(nodes, 0));
    assert(lines.size() == 3);
    // Width comes from the attributed subset only: "longer" quoted is 8 wide.
    assert(lines[0] == "\"a\"      [ k=1 ] ;");
    assert(lines[1] == "\"a_very_long_bare_identifier\" ;");
    assert(lines[2] == "\"longer\" [ k=2 ] ;");
    assert(lines[0].find('[') == lines[2].find('['));
    assert(lines[0].find('[') == 9);
    std::cout << "[PASS] Attributed node brackets share one column." << std::endl;
}

void TestEdgeAlignment() {
    EdgeSet edges;
    edges.addEdge("s", "dest_long", "c=1");
    edges.addEdge("source_long", "d", "c=2");
    edges.addEdge("s", "d");

    auto lines = SplitLines(DotSerializer::RenderEdges(edges, 0));
    assert(lines.size() == 3);
    assert(lines[0] == "\"s\"           -> \"d\" ;");
    assert(lines[1] == "\"s\"           -> \"dest_long\" [ c=1 ] ;");
    assert(lines[2] == "\"source_long\" -> \"d\"         [ c=2 ] ;");
    assert(lines[1].find('[') == lines[2].find('['));
    assert(lines[0].find("->") == lines[2].find("->"));
    std::cout << "[PASS] Edge source and destination columns align independently." << std::endl;
}

void TestIndentation() {
    NodeSet nodes;
    nodes.addNode("a");
    nodes.addNode("b");
    assert(DotSerializer::RenderNodes(nodes, 2) == "\"a\" ;\n\t\t\"b\" ;");
    assert(DotSerializer::RenderNodes(nodes, 0) == "\"a\" ;\n\"b\" ;");
    std::cout << "[PASS] Lines are joined with the requested tab depth." << std::endl;
}

void TestMalformedEntriesFailFast() {
    NodeSet nodes;
    EdgeSet edges;
    bool threw = false;
    try {
        nodes.addNode("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        edges.addEdge("coal", "");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(nodes.empty() && edges.empty());
    std::cout << "[PASS] Entries without identifiers are rejected." << std::endl;
}

void TestQuotingAndEmptyAttributes() {
    NodeSet nodes;
    nodes.addNode("say \"hi\"");
    nodes.addNode("plain", std::string());
    assert(nodes.size() == 2);
    assert(DotSerializer::RenderNodes(nodes, 0) == "\"plain\" ;\n\"say \\\"hi\\\"\" ;");
    std::cout << "[PASS] Embedded quotes are escaped; empty attributes count as none." << std::endl;
}

void TestBackslashesInIdentifiers() {
    // A trailing backslash must not swallow the closing quote.
    assert(DotSerializer::Quote("dir\\") == "\"dir\\\\\"");
    assert(DotSerializer::Quote("a\\\\") == "\"a\\\\\\\\\"");
    assert(DotSerializer::Quote("a\\\"b") == "\"a\\\\\\\"b\"");
    // Elsewhere a backslash is left alone.
    assert(DotSerializer::Quote("a\\b") == "\"a\\b\"");

    NodeSet nodes;
    nodes.addNode("dir\\", "label=\"end\"");
    assert(DotSerializer::RenderNodes(nodes) == "\"dir\\\\\" [ label=\"end\" ] ;");

    EdgeSet edges;
    edges.addEdge("x\\", "y");
    assert(DotSerializer::RenderEdges(edges) == "\"x\\\\\" -> \"y\" ;");
    std::cout << "[PASS] Backslashes before a closing quote are escaped." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting GraphSet/DotSerializer Test..." << std::endl;

    TestDuplicatesCollapse();
    TestSameIdDifferentAttributesKeptApart();
    TestOrderIndependence();
    TestEmptyPlaceholders();
    TestMixedNodeForms();
    TestNodeAlignment();
    TestEdgeAlignment();
    TestIndentation();
    TestMalformedEntriesFailFast();
    TestQuotingAndEmptyAttributes();
    TestBackslashesInIdentifiers();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
