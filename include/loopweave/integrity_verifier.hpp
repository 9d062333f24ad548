/**
 * @file integrity_verifier.hpp
 * @brief Frozen/duplicated-frame guard run before anything is published
 *
 * @details Frames are sampled at risky points of the produced file:
 *
 *          - every interval seconds (by default the background loop period,
 *            i.e. where the old multi-clip design put its joins)
 *
 *          - inside the first loop iteration and inside a later one
 *
 *          Each probe takes two samples a short gap apart. During continuous
 *          motion those must differ; identical digests mean a frozen frame.
 *          Samples from different probes may only be identical if they show
 *          the same background offset under the same overlay.
 *
 * @note The check is heuristic. Passing does not prove the absence of
 *       duplicates, but failing always points at a real defect or a
 *       motionless background.
 */

#ifndef LOOPWEAVE_INTEGRITY_VERIFIER_HPP
#define LOOPWEAVE_INTEGRITY_VERIFIER_HPP

#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace loopweave {

struct VerifyOptions {
  double interval_sec = 0.0;     //< 0 = loop period (or total / 4 unlooped)
  int max_probes = 8;            //< Cap on probe points, midpoints excepted
  double pair_gap_sec = 0.2;     //< Distance between the two samples
  double tolerance_frames = 1.0; //< Allowed duration error in frames

  static VerifyOptions from_config();
};

/**
 * @brief Choose the probe timestamps for a Timeline.
 * @return Sorted, distinct timestamps inside (0, total_duration)
 */
std::vector<double> plan_probe_points(const Timeline &timeline,
                                      const VerifyOptions &options);

/**
 * @brief The two sample times of one probe, clamped to decodable range.
 */
std::pair<double, double> sample_pair(const Timeline &timeline, double probe,
                                      const VerifyOptions &options);

/// Position of t inside the background loop (t itself when not looped)
double loop_offset(const Timeline &timeline, double t);

/// Index of the overlay window containing t (-1 if none)
int overlay_position(const Timeline &timeline, double t);

/**
 * @brief Judge fingerprinted samples and the measured duration.
 * @return Empty string on pass, otherwise the first defect found
 */
std::string evaluate_samples(const Timeline &timeline,
                             const std::vector<FrameSample> &samples,
                             double measured_duration,
                             const VerifyOptions &options);

/**
 * @class IntegrityVerifier
 * @brief Samples a produced file and returns the publishing verdict.
 */
class IntegrityVerifier {
public:
  explicit IntegrityVerifier(VerifyOptions options) : options_(options) {}

  /**
   * @brief Verify output_path against the Timeline that produced it.
   *
   * @details Sampling failures (unopenable file, undecodable timestamp) are
   *          IntegrityErrors; they are converted into a failing verdict
   *          instead of being thrown.
   */
  AssemblyResult verify(const Timeline &timeline,
                        const std::string &output_path) const;

private:
  VerifyOptions options_;
};

} // namespace loopweave

#endif // LOOPWEAVE_INTEGRITY_VERIFIER_HPP
