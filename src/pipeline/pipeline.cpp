#include "pathguard/pipeline.hpp"
#include "pathguard/sandbox.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

// Stage at which a resolve() error is detected
PipelineStage stage_for_resolve_error(PathError error) {
    switch (error) {
        case PathError::AbsoluteNotAllowed: return PipelineStage::Normalized;
        case PathError::EmptyInput:
        case PathError::NormalizationFailed:
        default: return PipelineStage::Start;
    }
}

PipelineResult fail(PathError error, PipelineStage stage) {
    PipelineResult result;
    result.error = error;
    result.stage = stage;
    return result;
}

} // namespace

Pipeline::Pipeline(TrustedRoot root, PipelineOptions options)
    : root_(std::move(root)), options_(options) {}

PipelineCreateResult Pipeline::create(const std::string& root, PipelineOptions options) {
    PipelineCreateResult result;
    auto trusted = make_trusted_root(root);
    if (!trusted.ok) {
        spdlog::error("Invalid trusted root: \"{}\"", root);
        result.error = trusted.error;
        return result;
    }
    spdlog::debug("Pipeline created with root {}", trusted.root->path());
    result.ok = true;
    result.pipeline.emplace(std::move(*trusted.root), options);
    return result;
}

ResolveResult Pipeline::resolve(const std::string& fragment) const {
    ResolveOptions opts;
    opts.allow_absolute = options_.allow_absolute;
    return pathguard::resolve(root_, fragment, opts);
}

ValidationVerdict Pipeline::check(const std::string& fragment) const {
    auto candidate = resolve(fragment);
    if (!candidate.ok) {
        return {false, {}, candidate.error};
    }
    return validate(root_, candidate.path);
}

PipelineResult Pipeline::run(const std::string& fragment) const {
    return run_impl(fragment, nullptr);
}

PipelineResult Pipeline::run(const std::string& fragment, const FileProcessor& processor) const {
    return run_impl(fragment, &processor);
}

std::vector<PipelineResult> Pipeline::run_each(const std::string& fragment,
                                               const std::vector<FileProcessor>& processors) const {
    std::vector<PipelineResult> results;
    results.reserve(processors.size());
    for (const auto& processor : processors) {
        results.push_back(run_impl(fragment, &processor));
    }
    return results;
}

std::optional<std::string> Pipeline::relative_to_root(const std::string& path) const {
    auto verdict = validate(root_, path);
    if (!verdict.safe) {
        return std::nullopt;
    }
    return relative_path(root_.path(), verdict.path);
}

PipelineResult Pipeline::run_impl(const std::string& fragment, const FileProcessor* processor) const {
    auto candidate = resolve(fragment);
    if (!candidate.ok) {
        spdlog::warn("Rejected fragment \"{}\": {}", fragment, path_error_to_string(candidate.error));
        return fail(candidate.error, stage_for_resolve_error(candidate.error));
    }
    spdlog::debug("Resolved \"{}\" to {}", fragment, candidate.path);

    auto verdict = validate(root_, candidate.path);
    if (!verdict.safe) {
        spdlog::warn("Blocked \"{}\" under {}: {}", fragment, root_.path(),
                     path_error_to_string(verdict.reason));
        return fail(verdict.reason, PipelineStage::Validated);
    }

    PipelineResult result;
    result.path = verdict.path;

    if (processor) {
        bool in_place = renames_in_place(*processor);

        // Renaming the root itself would produce a sibling of the root
        if (in_place && verdict.path == root_.path()) {
            spdlog::warn("Refusing to rename root {} for \"{}\"", root_.path(), fragment);
            return fail(PathError::EscapesRoot, PipelineStage::Transformed);
        }

        result.path = apply_processor(*processor, verdict.path);
        if (result.path.empty()) {
            spdlog::warn("{} produced an invalid filename for {}", describe(*processor),
                         verdict.path);
            return fail(PathError::InvalidFilename, PipelineStage::Transformed);
        }
        spdlog::debug("{}: {} -> {}", describe(*processor), verdict.path, result.path);

        // In-place renames must stay under the root regardless of confine_output
        if ((in_place || options_.confine_output) && !is_within_root(root_, result.path)) {
            spdlog::warn("Transformed path {} leaves root {}", result.path, root_.path());
            return fail(PathError::EscapesRoot, PipelineStage::Transformed);
        }
    }

    result.ok = true;
    result.stage = PipelineStage::Done;
    return result;
}

} // namespace pathguard
