/**
 * @file pipeline.hpp
 * @brief One assembly run, from input files to a verified video
 *
 * @details The AssemblyPipeline runs the stages strictly in order:
 *
 *          1. Validate parameters and segments, probe the assets
 *
 *          2. Render one overlay PNG per segment into the run's work dir
 *
 *          3. Plan the Timeline
 *
 *          4. Compose the output with ffmpeg
 *
 *          5. Verify the produced file
 *
 *          6. Remove the work dir (unless KEEP_WORK_DIR=1)
 *
 * @note When run_id >= 0, all log messages are prefixed with [Run N] and the
 *       phase timing table is not printed (batch mode).
 */

#ifndef LOOPWEAVE_PIPELINE_HPP
#define LOOPWEAVE_PIPELINE_HPP

#include <string>

#include "composition_engine.hpp"
#include "integrity_verifier.hpp"
#include "overlay_renderer.hpp"
#include "types.hpp"

namespace loopweave {

/**
 * @class AssemblyPipeline
 * @brief Orchestrates a single assembly run.
 *
 * @attention ISOLATION:
 *
 * - Each run owns its work dir and output path; nothing else is shared
 *
 * - The Timeline is built once and passed explicitly to every later stage
 */
class AssemblyPipeline {
  RunRequest request_;
  int run_id_; //< Run ID for log prefixing (-1 = no prefix)
  std::string work_dir_;

  RenderOptions render_options_;
  EncodeSettings encode_settings_;
  VerifyOptions verify_options_;

  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);

  /**
   * @brief Print what was assembled and the verdict.
   */
  void print_assembly_summary(const Timeline &timeline,
                              const AssemblyResult &result);

public:
  /**
   * @param request Assets, segments and output path of the run
   * @param run_id Run ID for log prefixing (-1 = single run)
   */
  explicit AssemblyPipeline(RunRequest request, int run_id = -1);

  /**
   * @brief Run every stage.
   *
   * @return Verdict; a failing verdict leaves the file in place but marks it
   *         unpublishable
   * @throws InputError, RenderError or CompositionError; the error is logged
   *         with its stage and subject before being rethrown
   */
  AssemblyResult run();

  const std::string &work_dir() const { return work_dir_; }

  /// Private directory of a run: <output dir>/.loopweave-<stem>-<pid>-<id>
  static std::string make_work_dir(const std::string &output_path,
                                   int run_id);
};

} // namespace loopweave

#endif // LOOPWEAVE_PIPELINE_HPP
