#pragma once

#include "domain/DiagramRenderer.hpp"
#include <chrono>
#include <string>

namespace systemviz::infrastructure {

/**
 * @class GraphvizRenderer
 * @brief Runs the Graphviz command line tool as a blocking child process.
 */
class GraphvizRenderer : public domain::DiagramRenderer {
public:
    GraphvizRenderer(const std::string& executable, std::chrono::seconds timeout);
    ~GraphvizRenderer() override = default;

    domain::RenderResult render(const domain::RenderRequest& request,
                                const std::atomic<bool>* cancelled = nullptr) override;

private:
    std::string m_executable;
    std::chrono::seconds m_timeout;
};

} // namespace systemviz::infrastructure
