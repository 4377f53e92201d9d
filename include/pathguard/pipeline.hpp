#pragma once

#include "pathguard/file_processor.hpp"
#include "pathguard/resolver.hpp"
#include "pathguard/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pathguard {

struct PipelineOptions {
    // Anchor absolute-looking fragments at the root (true) or reject them
    bool allow_absolute = true;

    // Re-validate the transformed path against the root
    bool confine_output = false;
};

struct PipelineResult {
    bool ok = false;
    std::string path;                           // final path when ok
    PathError error = PathError::None;
    PipelineStage stage = PipelineStage::Start; // last stage reached
};

struct PipelineCreateResult;

/**
 * Normalize -> resolve -> validate -> transform, against one trusted root.
 *
 * The root and options are fixed at construction. Every method is const
 * and keeps no per-call state, so one Pipeline may be shared freely across
 * threads. To change the root, construct a new Pipeline.
 *
 * Errors are returned as values. A blocked path is never replaced by a
 * default path.
 */
class Pipeline {
public:
    explicit Pipeline(TrustedRoot root, PipelineOptions options = {});

    // Validates root with make_trusted_root()
    static PipelineCreateResult create(const std::string& root, PipelineOptions options = {});

    const TrustedRoot& root() const { return root_; }
    const PipelineOptions& options() const { return options_; }

    // Candidate for fragment; not validated
    ResolveResult resolve(const std::string& fragment) const;

    // resolve + validate
    ValidationVerdict check(const std::string& fragment) const;

    // Validated path for fragment, no transformation
    PipelineResult run(const std::string& fragment) const;

    // Validated path for fragment, transformed by processor
    PipelineResult run(const std::string& fragment, const FileProcessor& processor) const;

    // One result per processor, in order
    std::vector<PipelineResult> run_each(const std::string& fragment,
                                         const std::vector<FileProcessor>& processors) const;

    // Path relative to the root ("." for the root itself), or nullopt when
    // path lies outside the root
    std::optional<std::string> relative_to_root(const std::string& path) const;

private:
    PipelineResult run_impl(const std::string& fragment, const FileProcessor* processor) const;

    TrustedRoot root_;
    PipelineOptions options_;
};

struct PipelineCreateResult {
    bool ok = false;
    std::optional<Pipeline> pipeline;
    PathError error = PathError::None;
};

} // namespace pathguard
