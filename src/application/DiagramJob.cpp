#include "application/DiagramJob.hpp"
#include "infrastructure/ArtifactWriter.hpp"

#include <iomanip>
#include <sstream>

namespace systemviz::application {

namespace {

domain::JobStatus FromRenderStatus(domain::RenderResult::Status status) {
    switch (status) {
        case domain::RenderResult::Status::Succeeded: return domain::JobStatus::Succeeded;
        case domain::RenderResult::Status::TimedOut: return domain::JobStatus::TimedOut;
        case domain::RenderResult::Status::Cancelled: return domain::JobStatus::Cancelled;
        case domain::RenderResult::Status::Failed:
        case domain::RenderResult::Status::LaunchFailed:
            break;
    }
    return domain::JobStatus::RendererFailed;
}

} // namespace

std::string DiagramJob::Amount(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

std::string DiagramJob::Image(const std::string& stem, const domain::RenderConfig& config) {
    return stem + "." + config.imageFormat;
}

domain::JobOutcome DiagramJob::Execute(const JobContext& context) const {
    domain::JobOutcome outcome;
    outcome.scopeKey = scopeKey();
    outcome.family = family();

    if (context.cancelled && context.cancelled->load()) {
        outcome.status = domain::JobStatus::Cancelled;
        outcome.message = "batch cancelled";
        return outcome;
    }

    std::optional<Artifact> artifact = compose(context.model, context.config);
    if (!artifact) {
        outcome.status = domain::JobStatus::SkippedEmpty;
        return outcome;
    }

    outcome.artifactPath = context.runRoot / (artifact->stem + ".dot");
    outcome.imagePath = context.runRoot / Image(artifact->stem, context.config);

    std::string error;
    if (!infrastructure::ArtifactWriter::Write(outcome.artifactPath, artifact->text, error)) {
        outcome.status = domain::JobStatus::WriteFailed;
        outcome.message = error;
        return outcome;
    }

    domain::RenderRequest request;
    request.format = context.config.imageFormat;
    request.outputPath = outcome.imagePath;
    request.inputPath = outcome.artifactPath;

    domain::RenderResult result = context.renderer.render(request, context.cancelled);
    outcome.status = FromRenderStatus(result.status);
    outcome.message = result.message;
    return outcome;
}

} // namespace systemviz::application
