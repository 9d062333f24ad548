/**
 * @file integrity_verifier.cpp
 * @brief Probe planning, sampling and verdict
 */

#include "loopweave/integrity_verifier.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <fmt/core.h>

#include "loopweave/config.hpp"
#include "loopweave/errors.hpp"
#include "loopweave/frame_sampler.hpp"
#include "loopweave/logging.hpp"

namespace loopweave {

namespace {

/// Upper bound on generated interval points before subsampling
constexpr size_t MAX_INTERVAL_POINTS = 100000;

double frame_interval(const Timeline &tl) {
  return tl.fps > 0 ? 1.0 / tl.fps : 0.04;
}

/// Pick count items spread evenly over v, keeping both ends
std::vector<double> spread(const std::vector<double> &v, size_t count) {
  if (count == 0)
    return {};
  if (v.size() <= count)
    return v;
  if (count == 1)
    return {v[v.size() / 2]};
  std::vector<double> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    size_t idx = static_cast<size_t>(std::llround(
        static_cast<double>(i) * (v.size() - 1) / (count - 1)));
    out.push_back(v[idx]);
  }
  return out;
}

} // anonymous namespace

VerifyOptions VerifyOptions::from_config() {
  VerifyOptions o;
  o.interval_sec = Config::verify_interval_sec();
  o.max_probes = Config::verify_max_probes();
  o.pair_gap_sec = Config::verify_pair_gap_sec();
  o.tolerance_frames = Config::duration_tolerance_frames();
  return o;
}

// **---- Probe planning ----**

std::vector<double> plan_probe_points(const Timeline &tl,
                                      const VerifyOptions &options) {
  const double d = tl.total_duration;
  const double period = tl.background.loop ? tl.background.source.duration : 0.0;
  const double interval = options.interval_sec > 0.0 ? options.interval_sec
                          : period > 0.0             ? period
                                                     : d / 4.0;

  std::vector<double> multiples;
  for (int k = 1; multiples.size() < MAX_INTERVAL_POINTS; ++k) {
    double t = k * interval;
    if (t >= d - DURATION_EPSILON)
      break;
    multiples.push_back(t);
  }

  /// Points strictly inside the first and a later loop iteration
  std::vector<double> required;
  if (period > 0.0) {
    required.push_back(period / 2.0);
    int complete = static_cast<int>(std::floor(d / period + 1e-9));
    if (complete >= 2)
      required.push_back((complete - 1) * period + period / 2.0);
    else
      required.push_back(period + (d - period) / 2.0);
  }

  /// The iteration midpoints are always probed, whatever the cap
  const size_t cap = std::max(
      static_cast<size_t>(std::max(1, options.max_probes)), required.size());

  std::vector<double> points = spread(multiples, cap - required.size());
  points.insert(points.end(), required.begin(), required.end());
  std::sort(points.begin(), points.end());

  /// Drop points too close to the previous one to give distinct samples
  std::vector<double> out;
  for (double t : points) {
    if (t <= 0.0 || t >= d)
      continue;
    if (!out.empty() && t - out.back() < options.pair_gap_sec)
      continue;
    out.push_back(t);
  }
  return out;
}

std::pair<double, double> sample_pair(const Timeline &tl, double probe,
                                      const VerifyOptions &options) {
  const double last = std::max(0.0, tl.total_duration - frame_interval(tl));
  const double half = options.pair_gap_sec / 2.0;
  double a = std::clamp(probe - half, 0.0, last);
  double b = std::clamp(probe + half, 0.0, last);
  if (b - a < options.pair_gap_sec)
    a = std::max(0.0, b - options.pair_gap_sec);
  return {a, b};
}

double loop_offset(const Timeline &tl, double t) {
  if (!tl.background.loop || tl.background.source.duration <= 0.0)
    return t;
  return std::fmod(t, tl.background.source.duration);
}

int overlay_position(const Timeline &tl, double t) {
  auto it = std::upper_bound(
      tl.windows.begin(), tl.windows.end(), t,
      [](double v, const OverlayWindow &w) { return v < w.end; });
  if (it == tl.windows.end() || t < it->start)
    return -1;
  return static_cast<int>(it - tl.windows.begin());
}

// **---- Verdict ----**

std::string evaluate_samples(const Timeline &tl,
                             const std::vector<FrameSample> &samples,
                             double measured_duration,
                             const VerifyOptions &options) {
  const double frame = frame_interval(tl);

  const double tolerance = options.tolerance_frames * frame;
  if (std::fabs(measured_duration - tl.total_duration) > tolerance + 1e-9) {
    return fmt::format(
        "duration {:.3f}s differs from requested {:.3f}s by more than {:.3f}s",
        measured_duration, tl.total_duration, tolerance);
  }

  if (samples.empty())
    return "no frames were sampled";

  for (size_t i = 0; i < samples.size(); ++i) {
    for (size_t j = i + 1; j < samples.size(); ++j) {
      const FrameSample &a = samples[i];
      const FrameSample &b = samples[j];
      if (a.sha256 != b.sha256)
        continue;
      /// The same decoded frame reached twice is not a defect
      if (std::fabs(a.decoded_time - b.decoded_time) < frame / 2.0)
        continue;

      if (a.probe == b.probe) {
        return fmt::format("frozen frame: {:.3f}s and {:.3f}s are identical",
                           a.decoded_time, b.decoded_time);
      }

      double offset_gap = std::fabs(a.loop_offset - b.loop_offset);
      if (tl.background.loop && tl.background.source.duration > 0.0) {
        offset_gap =
            std::min(offset_gap, tl.background.source.duration - offset_gap);
      }
      if (offset_gap > frame / 2.0 || a.overlay_position != b.overlay_position) {
        return fmt::format(
            "duplicated frame: {:.3f}s repeats {:.3f}s (loop offsets "
            "{:.3f}s/{:.3f}s, overlays {}/{})",
            b.decoded_time, a.decoded_time, a.loop_offset, b.loop_offset,
            a.overlay_position, b.overlay_position);
      }
    }
  }
  return {};
}

AssemblyResult IntegrityVerifier::verify(const Timeline &tl,
                                         const std::string &output_path) const {
  auto start = std::chrono::steady_clock::now();

  AssemblyResult result;
  result.output_path = output_path;

  try {
    FrameSampler sampler(output_path);
    result.total_duration = sampler.get_video_duration();

    const std::vector<double> probes = plan_probe_points(tl, options_);
    LOG_INFO("Verifying {} at {} probe points", output_path, probes.size());

    for (size_t p = 0; p < probes.size(); ++p) {
      auto [first, second] = sample_pair(tl, probes[p], options_);
      for (double t : {first, second}) {
        FrameFingerprint fp = sampler.fingerprint_at(t);
        result.samples.push_back({t, fp.decoded_time, static_cast<int>(p),
                                  loop_offset(tl, fp.decoded_time),
                                  overlay_position(tl, fp.decoded_time),
                                  fp.sha256});
      }
    }

    result.reason =
        evaluate_samples(tl, result.samples, result.total_duration, options_);
  } catch (const IntegrityError &e) {
    result.reason = e.what();
    if (!e.diagnostic().empty())
      result.reason += fmt::format(" ({})", e.diagnostic());
  }

  result.status =
      result.reason.empty() ? VerificationStatus::Pass : VerificationStatus::Fail;
  result.elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - start)
                           .count();

  if (result.publishable()) {
    LOG_INFO("Verification passed ({} samples, {:.3f}s)", result.samples.size(),
             result.total_duration);
  } else {
    LOG_ERROR("Verification failed: {}", result.reason);
  }
  return result;
}

} // namespace loopweave
