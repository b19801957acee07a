/**
 * @file GraphSet.hpp
 * @brief Deduplicated node and edge collections for a single diagram.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <tuple>

namespace systemviz::domain {

/**
 * @struct NodeEntry
 * @brief A node statement: identifier plus optional free-form attribute text.
 */
struct NodeEntry {
    std::string id;
    std::optional<std::string> attributes; ///< e.g. `color="red", href="x.svg"`

    bool operator<(const NodeEntry& other) const {
        return std::tie(id, attributes) < std::tie(other.id, other.attributes);
    }
    bool operator==(const NodeEntry& other) const {
        return id == other.id && attributes == other.attributes;
    }
};

/**
 * @struct EdgeEntry
 * @brief An edge statement: source, destination and optional attribute text.
 */
struct EdgeEntry {
    std::string source;
    std::string destination;
    std::optional<std::string> attributes;

    bool operator<(const EdgeEntry& other) const {
        return std::tie(source, destination, attributes) <
               std::tie(other.source, other.destination, other.attributes);
    }
    bool operator==(const EdgeEntry& other) const {
        return source == other.source && destination == other.destination &&
               attributes == other.attributes;
    }
};

/**
 * @class NodeSet
 * @brief Set of node entries; equality is over the whole (id, attributes) pair.
 *
 * Two entries with the same id but different attributes are kept apart and
 * both render. Repeated identical additions have no effect.
 */
class NodeSet {
public:
    /**
     * @brief Adds a node statement.
     * @throws std::invalid_argument if the identifier is empty.
     */
    void addNode(const std::string& id, std::optional<std::string> attributes = std::nullopt);

    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }
    const std::set<NodeEntry>& entries() const { return m_entries; }

private:
    std::set<NodeEntry> m_entries;
};

/**
 * @class EdgeSet
 * @brief Set of edge entries; equality is over (source, destination, attributes).
 */
class EdgeSet {
public:
    /**
     * @brief Adds an edge statement.
     * @throws std::invalid_argument if either endpoint is empty.
     */
    void addEdge(const std::string& source, const std::string& destination,
                 std::optional<std::string> attributes = std::nullopt);

    bool empty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }
    const std::set<EdgeEntry>& entries() const { return m_entries; }

private:
    std::set<EdgeEntry> m_entries;
};

} // namespace systemviz::domain
