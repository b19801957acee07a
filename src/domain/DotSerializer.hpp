/**
 * @file DotSerializer.hpp
 * @brief Renders node and edge sets as aligned, sorted DOT statements.
 */

#pragma once

#include "domain/GraphSet.hpp"
#include <string>

namespace systemviz::domain {

/**
 * @class DotSerializer
 * @brief Stateless text renderer for NodeSet / EdgeSet contents.
 *
 * Output is a pure function of the set contents: lines are sorted by their
 * full rendered text and joined with a newline followed by @p indent tabs.
 * Identifier columns are padded so that attribute brackets line up.
 */
class DotSerializer {
public:
    static constexpr const char* kEmptyNodesPlaceholder = "// no nodes in this section";
    static constexpr const char* kEmptyEdgesPlaceholder = "// no edges in this section";

    /**
     * @brief Renders node statements.
     *
     * Attributed entries become `"<id>" [ <attrs> ] ;` with the id field padded
     * to the widest quoted id among attributed entries; bare entries become
     * `"<id>" ;`.
     * @return The joined lines, or kEmptyNodesPlaceholder for an empty set.
     */
    static std::string RenderNodes(const NodeSet& nodes, int indent = 1);

    /**
     * @brief Renders edge statements.
     *
     * `"<src>" -> "<dst>" [ <attrs> ] ;` or `"<src>" -> "<dst>" ;`. Source and
     * destination columns are padded independently to the widest quoted id of
     * each column.
     * @return The joined lines, or kEmptyEdgesPlaceholder for an empty set.
     */
    static std::string RenderEdges(const EdgeSet& edges, int indent = 1);

    /** @brief Wraps an identifier in double quotes, escaping embedded quotes. */
    static std::string Quote(const std::string& id);

    /**
     * @brief Escapes text for use between DOT double quotes.
     *
     * `"` and raw newlines are escaped. A run of backslashes is doubled only where
     * it would otherwise escape a quote (before `"` or at the end), so label
     * sequences such as `\n` pass through.
     */
    static std::string EscapeQuoted(const std::string& text);

    /** @brief Text safe for a single `//` comment line: newlines become spaces. */
    static std::string SingleLine(const std::string& text);
};

} // namespace systemviz::domain
