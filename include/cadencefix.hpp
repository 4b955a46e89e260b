//
//  cadencefix.hpp
//  CadenceFix
//
//  Created by Till Toenshoff on 10/18/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "inspector.hpp"
#include "logging.hpp"
#include "retimer.hpp"

namespace cadencefix {

/// @defgroup api CadenceFix Public API
/// Public, supported C++ interfaces for retiming recorded WebM/Matroska containers.
/// @{

struct RetimeOptions {
    double fps = 60.0;
    std::optional<uint64_t> frame_count;  ///< Defaults to the number of SimpleBlocks found.
    bool allow_fallback = true;           ///< Return the raw bytes if the rewrite fails.
};

/**
 * @brief Final bytes of a recording plus how they were obtained.
 *
 * `status.ok` is true whenever `data` is usable, including the fallback case. When
 * `used_fallback` is set, `data` is the unmodified input and `fallback_reason` says why the
 * rewrite was abandoned.
 */
struct FinalizeResult {
    RetimeStatus status;
    std::vector<uint8_t> data;
    bool used_fallback = false;
    std::string fallback_reason;
    uint64_t frame_count = 0;
};

/// Retime job as read from a JSON job file.
struct RetimeJob {
    std::vector<std::string> inputs;
    std::string output;
    RetimeOptions options;
    std::optional<LogVerbosity> log_level;
};

struct InspectResult {
    RetimeStatus status;
    ContainerSummary summary;
};

/**
 * @brief Return the CadenceFix library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// Concatenate producer chunks in order; empty chunks are skipped.
std::vector<uint8_t> assemble_chunks(const std::vector<std::vector<uint8_t>> &chunks);

/**
 * @brief Rewrite a finished recording to a constant frame rate.
 *
 * @param raw Complete container as captured.
 * @param options Target rate, optional frame count, fallback policy.
 */
FinalizeResult finalize_recording(const std::vector<uint8_t> &raw,
                                  const RetimeOptions &options);  ///< @ingroup api

/**
 * @brief Read chunk files, retime them and write the result.
 *
 * @param input_paths Producer chunks, concatenated in the given order.
 * @param output_path Destination file.
 * @param options Target rate, optional frame count, fallback policy.
 * @param used_fallback Optional; set to true when the raw bytes were written.
 */
RetimeStatus retime_file(const std::vector<std::string> &input_paths,
                         const std::string &output_path, const RetimeOptions &options,
                         bool *used_fallback = nullptr);  ///< @ingroup api

/// Summarize the container stored at |path|.
InspectResult inspect_file(const std::string &path);  ///< @ingroup api

/// Load a JSON job file; relative paths resolve against the job file's directory.
RetimeStatus load_job_json(const std::string &path, RetimeJob &job);  ///< @ingroup api

/// @}

#ifdef CADENCEFIX_TESTING
namespace testing {
RetimeStatus parse_job_json_for_test(const std::string &text, const std::string &base_dir,
                                     RetimeJob &job);
}  // namespace testing
#endif

}  // namespace cadencefix
