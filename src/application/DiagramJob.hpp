/**
 * @file DiagramJob.hpp
 * @brief Base class for one self-contained diagram-generation unit.
 */

#pragma once

#include "domain/DiagramRenderer.hpp"
#include "domain/EnergySystemModel.hpp"
#include "domain/JobOutcome.hpp"
#include "domain/RenderConfig.hpp"
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace systemviz::application {

/**
 * @struct JobContext
 * @brief Read-only resources shared by every job of a batch.
 */
struct JobContext {
    const domain::EnergySystemModel& model;
    const domain::RenderConfig& config;
    domain::DiagramRenderer& renderer;
    std::filesystem::path runRoot;               ///< Absolute run directory.
    const std::atomic<bool>* cancelled = nullptr;
};

/**
 * @struct Artifact
 * @brief Composed DOT text and where it goes.
 */
struct Artifact {
    std::string stem; ///< Path relative to the run root, without extension (e.g. "processes/process_e_coal").
    std::string text;
};

/**
 * @class DiagramJob
 * @brief Composes one artifact for one scope, writes it and renders it.
 *
 * Subclasses only describe the diagram in compose(); Execute() owns the
 * write/render sequence and the mapping to a JobOutcome.
 */
class DiagramJob {
public:
    virtual ~DiagramJob() = default;

    /** @brief Short family tag, e.g. "process". */
    virtual std::string family() const = 0;

    /** @brief Scope identifier within the family, e.g. the technology name. */
    virtual std::string scopeKey() const = 0;

    /**
     * @brief Builds the artifact text.
     * @return nullopt when the scope has nothing to draw.
     */
    virtual std::optional<Artifact> compose(const domain::EnergySystemModel& model,
                                            const domain::RenderConfig& config) const = 0;

    /**
     * @brief compose() + atomic write + render.
     *
     * Exceptions thrown by compose() propagate; the dispatcher records them.
     */
    domain::JobOutcome Execute(const JobContext& context) const;

protected:
    /** @brief `%.2f` formatting used for every numeric label. */
    static std::string Amount(double value);

    /** @brief `<stem>.<image format>`, used for href cross-links. */
    static std::string Image(const std::string& stem, const domain::RenderConfig& config);
};

} // namespace systemviz::application
