#include "domain/DotSerializer.hpp"

#include <algorithm>
#include <set>

namespace systemviz::domain {

namespace {

std::string PadRight(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return text + std::string(width - text.size(), ' ');
}

std::string JoinSorted(const std::set<std::string>& lines, int indent) {
    const std::string separator = "\n" + std::string(static_cast<size_t>(std::max(indent, 0)), '\t');
    std::string out;
    bool first = true;
    for (const auto& line : lines) {
        if (!first) out += separator;
        out += line;
        first = false;
    }
    return out;
}

} // namespace

std::string DotSerializer::EscapeQuoted(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '"') {
            out += "\\\"";
        } else if (ch == '\n') {
            out += "\\n";
        } else if (ch == '\\') {
            size_t end = i;
            while (end < text.size() && text[end] == '\\') ++end;
            const size_t run = end - i;
            // A run that ends the text or precedes a quote would escape it.
            const bool closesQuote = end == text.size() || text[end] == '"';
            out.append(closesQuote ? run * 2 : run, '\\');
            i = end - 1;
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

std::string DotSerializer::SingleLine(const std::string& text) {
    std::string out = text;
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return out;
}

std::string DotSerializer::Quote(const std::string& id) {
    return "\"" + EscapeQuoted(id) + "\"";
}

std::string DotSerializer::RenderNodes(const NodeSet& nodes, int indent) {
    if (nodes.empty()) {
        return kEmptyNodesPlaceholder;
    }

    size_t width = 0;
    for (const auto& node : nodes.entries()) {
        if (node.attributes) {
            width = std::max(width, Quote(node.id).size());
        }
    }

    // std::set gives uniqueness of the rendered text and byte-wise ordering.
    std::set<std::string> lines;
    for (const auto& node : nodes.entries()) {
        if (node.attributes) {
            lines.insert(PadRight(Quote(node.id), width) + " [ " + *node.attributes + " ] ;");
        } else {
            lines.insert(Quote(node.id) + " ;");
        }
    }
    return JoinSorted(lines, indent);
}

std::string DotSerializer::RenderEdges(const EdgeSet& edges, int indent) {
    if (edges.empty()) {
        return kEmptyEdgesPlaceholder;
    }

    size_t sourceWidth = 0;
    size_t destinationWidth = 0;
    for (const auto& edge : edges.entries()) {
        sourceWidth = std::max(sourceWidth, Quote(edge.source).size());
        destinationWidth = std::max(destinationWidth, Quote(edge.destination).size());
    }

    std::set<std::string> lines;
    for (const auto& edge : edges.entries()) {
        const std::string source = PadRight(Quote(edge.source), sourceWidth);
        if (edge.attributes) {
            lines.insert(source + " -> " + PadRight(Quote(edge.destination), destinationWidth) +
                         " [ " + *edge.attributes + " ] ;");
        } else {
            lines.insert(source + " -> " + Quote(edge.destination) + " ;");
        }
    }
    return JoinSorted(lines, indent);
}

} // namespace systemviz::domain
