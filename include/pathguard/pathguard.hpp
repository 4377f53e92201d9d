/**
 * @file pathguard.hpp
 * @brief Sandboxed path resolution and filename transformation
 *
 * Resolves untrusted path fragments against a trusted root directory,
 * rejects anything that would escape it, and computes new filenames for
 * downstream file operations. Everything here is lexical: no function
 * touches the filesystem.
 *
 * ## Example
 *
 * ```cpp
 * auto created = pathguard::Pipeline::create("/srv/uploads");
 * if (!created.ok) {
 *     return;
 * }
 * const auto& pipeline = *created.pipeline;
 *
 * auto result = pipeline.run("reports/2025.pdf", pathguard::Relocate{"/srv/archive"});
 * if (!result.ok) {
 *     // reject the request: never fall back to a default path
 *     std::cerr << pathguard::path_error_to_string(result.error) << "\n";
 * }
 * ```
 *
 * ## Symlinks
 *
 * Validation is lexical. A symlink inside the root that points outside it is
 * not detected; canonicalize the physical target and validate it again
 * before writing.
 */

#pragma once

#ifndef PATHGUARD_VERSION
#define PATHGUARD_VERSION "1.0.0"
#endif

#include "pathguard/types.hpp"
#include "pathguard/normalizer.hpp"
#include "pathguard/resolver.hpp"
#include "pathguard/sandbox.hpp"
#include "pathguard/extensions.hpp"
#include "pathguard/clock.hpp"
#include "pathguard/file_processor.hpp"
#include "pathguard/pipeline.hpp"
#include "pathguard/config.hpp"
