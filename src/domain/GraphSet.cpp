#include "domain/GraphSet.hpp"

#include <stdexcept>

namespace systemviz::domain {

void NodeSet::addNode(const std::string& id, std::optional<std::string> attributes) {
    if (id.empty()) {
        throw std::invalid_argument("NodeSet: node entry without an identifier");
    }
    // An empty attribute string renders exactly like no attributes at all.
    if (attributes && attributes->empty()) {
        attributes.reset();
    }
    m_entries.insert(NodeEntry{id, std::move(attributes)});
}

void EdgeSet::addEdge(const std::string& source, const std::string& destination,
                      std::optional<std::string> attributes) {
    if (source.empty() || destination.empty()) {
        throw std::invalid_argument("EdgeSet: edge entry missing source or destination (" +
                                    source + " -> " + destination + ")");
    }
    if (attributes && attributes->empty()) {
        attributes.reset();
    }
    m_entries.insert(EdgeEntry{source, destination, std::move(attributes)});
}

} // namespace systemviz::domain
