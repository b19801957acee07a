/**
 * @file DotDocument.hpp
 * @brief Statement-level writer for strict DOT digraph artifacts.
 *
 * Replaces fixed text templates with named insertion points: callers append
 * graph attributes, default node/edge attributes, nested subgraphs and
 * serialized NodeSet/EdgeSet blocks, and the writer keeps indentation,
 * quoting and brace balance consistent.
 */

#pragma once

#include "domain/GraphSet.hpp"
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace systemviz::domain {

/**
 * @class AttributeList
 * @brief Ordered `key="value"` pairs rendered as `k1="v1", k2="v2"`.
 */
class AttributeList {
public:
    AttributeList() = default;

    /**
     * @brief Appends one attribute. Values are escaped, keys are validated.
     * @throws std::invalid_argument if @p key is not a plain DOT identifier.
     */
    AttributeList& add(const std::string& key, const std::string& value);

    bool empty() const { return m_items.empty(); }
    std::string str() const;

    /** @brief Escapes a value for use inside a quoted DOT string; see DotSerializer::EscapeQuoted. */
    static std::string Escape(const std::string& value);

private:
    std::vector<std::pair<std::string, std::string>> m_items;
};

/**
 * @class DotDocument
 * @brief Builds the full text of one `strict digraph`.
 */
class DotDocument {
public:
    /**
     * @param graphName Name after `strict digraph`.
     * @param description Optional sentence appended to the generated-file banner.
     */
    explicit DotDocument(std::string graphName, std::string description = "");

    /** @brief `// text` at the current depth. */
    DotDocument& comment(const std::string& text);

    /** @brief `key = "value" ;` at the current depth (graph or subgraph attribute). */
    DotDocument& attribute(const std::string& key, const std::string& value);

    /** @brief `node [ ... ] ;` default node attributes for the current scope. */
    DotDocument& nodeDefaults(const AttributeList& attributes);

    /** @brief `edge [ ... ] ;` default edge attributes for the current scope. */
    DotDocument& edgeDefaults(const AttributeList& attributes);

    DotDocument& beginSubgraph(const std::string& name);

    /** @throws std::logic_error when no subgraph is open. */
    DotDocument& endSubgraph();

    /** @brief Inserts serialized node statements (or the empty placeholder). */
    DotDocument& nodes(const NodeSet& nodes);

    /** @brief Inserts serialized edge statements (or the empty placeholder). */
    DotDocument& edges(const EdgeSet& edges);

    DotDocument& blankLine();

    /**
     * @brief Returns the finished artifact text, banner included.
     * @throws std::logic_error if a subgraph is still open.
     */
    std::string str() const;

    /** @brief Quotes @p id unless it is already a plain DOT identifier. */
    static std::string Identifier(const std::string& id);

private:
    void line(const std::string& text);
    std::string indentation() const;

    std::string m_graphName;
    std::string m_description;
    std::ostringstream m_body;
    std::vector<std::string> m_openSubgraphs;
};

} // namespace systemviz::domain
