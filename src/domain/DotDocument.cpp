#include "domain/DotDocument.hpp"
#include "domain/DotSerializer.hpp"

#include <cctype>
#include <stdexcept>

namespace systemviz::domain {

namespace {

bool IsPlainIdentifier(const std::string& text) {
    if (text.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(text[0]))) return false;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && ch != '_') return false;
    }
    return true;
}

const char* kBanner =
    "// This file is generated by SystemViz.  It is a Graphviz DOT language text\n"
    "// description of an energy system model instance.  Graphviz reads this\n"
    "// file to create an equivalent image in a number of formats, including\n"
    "// SVG, PNG, GIF, and PDF.  For example, to create an SVG image:\n"
    "//\n"
    "// dot -Tsvg -o model.svg model.dot\n"
    "//\n"
    "// For more information, see the Graphviz homepage: http://graphviz.org/\n";

} // namespace

AttributeList& AttributeList::add(const std::string& key, const std::string& value) {
    if (!IsPlainIdentifier(key)) {
        throw std::invalid_argument("AttributeList: invalid attribute name '" + key + "'");
    }
    m_items.emplace_back(key, value);
    return *this;
}

std::string AttributeList::str() const {
    std::string out;
    for (size_t i = 0; i < m_items.size(); ++i) {
        if (i > 0) out += ", ";
        out += m_items[i].first + "=\"" + Escape(m_items[i].second) + "\"";
    }
    return out;
}

std::string AttributeList::Escape(const std::string& value) {
    return DotSerializer::EscapeQuoted(value);
}

DotDocument::DotDocument(std::string graphName, std::string description)
    : m_graphName(std::move(graphName)), m_description(std::move(description)) {}

std::string DotDocument::Identifier(const std::string& id) {
    return IsPlainIdentifier(id) ? id : DotSerializer::Quote(id);
}

std::string DotDocument::indentation() const {
    return std::string(m_openSubgraphs.size() + 1, '\t');
}

void DotDocument::line(const std::string& text) {
    m_body << indentation() << text << "\n";
}

DotDocument& DotDocument::comment(const std::string& text) {
    line("// " + DotSerializer::SingleLine(text));
    return *this;
}

DotDocument& DotDocument::attribute(const std::string& key, const std::string& value) {
    if (!IsPlainIdentifier(key)) {
        throw std::invalid_argument("DotDocument: invalid attribute name '" + key + "'");
    }
    line(key + " = \"" + AttributeList::Escape(value) + "\" ;");
    return *this;
}

DotDocument& DotDocument::nodeDefaults(const AttributeList& attributes) {
    line("node [ " + attributes.str() + " ] ;");
    return *this;
}

DotDocument& DotDocument::edgeDefaults(const AttributeList& attributes) {
    line("edge [ " + attributes.str() + " ] ;");
    return *this;
}

DotDocument& DotDocument::beginSubgraph(const std::string& name) {
    line("subgraph " + Identifier(name) + " {");
    m_openSubgraphs.push_back(name);
    return *this;
}

DotDocument& DotDocument::endSubgraph() {
    if (m_openSubgraphs.empty()) {
        throw std::logic_error("DotDocument: endSubgraph() without an open subgraph in " + m_graphName);
    }
    m_openSubgraphs.pop_back();
    line("}");
    return *this;
}

DotDocument& DotDocument::nodes(const NodeSet& nodes) {
    const int depth = static_cast<int>(m_openSubgraphs.size()) + 1;
    line(DotSerializer::RenderNodes(nodes, depth));
    return *this;
}

DotDocument& DotDocument::edges(const EdgeSet& edges) {
    const int depth = static_cast<int>(m_openSubgraphs.size()) + 1;
    line(DotSerializer::RenderEdges(edges, depth));
    return *this;
}

DotDocument& DotDocument::blankLine() {
    m_body << "\n";
    return *this;
}

std::string DotDocument::str() const {
    if (!m_openSubgraphs.empty()) {
        throw std::logic_error("DotDocument: subgraph '" + m_openSubgraphs.back() +
                               "' is still open in " + m_graphName);
    }
    std::ostringstream out;
    out << kBanner;
    if (!m_description.empty()) {
        out << "\n// " << DotSerializer::SingleLine(m_description) << "\n";
    }
    out << "\nstrict digraph " << Identifier(m_graphName) << " {\n";
    out << m_body.str();
    out << "}\n";
    return out.str();
}

} // namespace systemviz::domain
