/**
 * @file segment_manifest.cpp
 * @brief Manifest and job file parsing
 */

#include "loopweave/segment_manifest.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>

#include "loopweave/errors.hpp"

namespace loopweave {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string &s) {
  const char *ws = TEXT_WHITESPACE;
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

/// Strict decimal parse: whole string, finite
bool parse_number(const std::string &text, double &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(v))
    return false;
  out = v;
  return true;
}

std::string resolve(const fs::path &base, const std::string &value) {
  fs::path p(value);
  return p.is_absolute() ? p.string() : (base / p).lexically_normal().string();
}

} // anonymous namespace

std::pair<std::string, std::string> split_reference(const std::string &text) {
  size_t pos = text.rfind(" - ");
  if (pos == std::string::npos)
    return {trim(text), {}};
  std::string verse = trim(text.substr(0, pos));
  std::string reference = trim(text.substr(pos + 3));
  if (verse.empty())
    return {trim(text), {}};
  return {verse, reference};
}

double parse_positive(const std::string &text, const std::string &what) {
  double v = 0.0;
  if (!parse_number(trim(text), v) || v <= 0.0)
    throw InputError(
        fmt::format("{} must be a positive number, got '{}'", what, text));
  return v;
}

int parse_dimension(const std::string &text, const std::string &what) {
  double v = parse_positive(text, what);
  if (v != std::floor(v))
    throw InputError(fmt::format("{} must be a whole number of pixels, got '{}'",
                                 what, text));
  if (v > MAX_DIMENSION)
    throw InputError(fmt::format("{} {} exceeds the {} pixel limit", what, text,
                                 MAX_DIMENSION));
  return static_cast<int>(v);
}

std::vector<OverlaySegment> parse_segments(std::istream &in,
                                           const std::string &source) {
  std::vector<OverlaySegment> segments;
  std::string raw;
  int line_no = 0;

  while (std::getline(in, raw)) {
    ++line_no;
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#')
      continue;

    OverlaySegment seg;
    seg.sequence_index = static_cast<int>(segments.size());

    /// "<seconds>|text": only a numeric prefix counts as a duration
    size_t bar = line.find('|');
    if (bar != std::string::npos) {
      std::string prefix = trim(line.substr(0, bar));
      double v = 0.0;
      if (parse_number(prefix, v)) {
        if (v <= 0.0) {
          throw InputError(
              fmt::format("requested duration must be positive, got '{}'",
                          prefix),
              fmt::format("{}:{}", source, line_no));
        }
        seg.requested_duration = v;
        line = trim(line.substr(bar + 1));
      }
    }

    auto [verse, reference] = split_reference(line);
    if (verse.empty()) {
      throw InputError("segment has no text",
                       fmt::format("{}:{}", source, line_no));
    }
    seg.text = std::move(verse);
    seg.reference = std::move(reference);
    segments.push_back(std::move(seg));
  }
  return segments;
}

std::vector<OverlaySegment> load_segments(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw InputError("cannot read segment manifest", path,
                     std::strerror(errno));
  return parse_segments(in, path);
}

JobSpec parse_job(std::istream &in, const std::string &job_path) {
  const fs::path base = fs::path(job_path).parent_path();
  JobSpec job;
  job.name = fs::path(job_path).stem().string();

  std::string raw;
  int line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#')
      continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw InputError("expected 'key = value'",
                       fmt::format("{}:{}", job_path, line_no));
    }
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    if (key == "background") {
      job.background = resolve(base, value);
    } else if (key == "music") {
      job.music = resolve(base, value);
    } else if (key == "narration") {
      job.narration = value.empty() ? std::string() : resolve(base, value);
    } else if (key == "segments") {
      job.segments = resolve(base, value);
    } else if (key == "output") {
      job.output_name = value;
    } else if (key == "duration") {
      job.duration = parse_positive(value, "duration");
    } else if (key == "width") {
      job.canvas.width = parse_dimension(value, "width");
    } else if (key == "height") {
      job.canvas.height = parse_dimension(value, "height");
    } else {
      throw InputError(fmt::format("unknown key '{}'", key),
                       fmt::format("{}:{}", job_path, line_no));
    }
  }

  if (job.background.empty())
    throw InputError("missing key 'background'", job_path);
  if (job.music.empty())
    throw InputError("missing key 'music'", job_path);
  if (job.segments.empty())
    throw InputError("missing key 'segments'", job_path);
  if (job.duration <= 0.0)
    throw InputError("missing key 'duration'", job_path);
  if (job.output_name.empty())
    job.output_name = job.name + ".mp4";
  return job;
}

JobSpec load_job(const std::string &job_path) {
  std::ifstream in(job_path);
  if (!in)
    throw InputError("cannot read job file", job_path, std::strerror(errno));
  return parse_job(in, job_path);
}

std::vector<std::string> find_job_files(const std::string &jobs_dir) {
  std::vector<std::string> files;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(jobs_dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".job")
      files.push_back(entry.path().string());
  }
  if (ec)
    throw InputError("cannot list job directory", jobs_dir, ec.message());
  std::sort(files.begin(), files.end());
  return files;
}

RunRequest make_request(const JobSpec &job, const std::string &output_dir) {
  RunRequest req;
  req.background_path = job.background;
  req.music_path = job.music;
  req.narration_path = job.narration;
  req.segments = load_segments(job.segments);
  req.total_duration = job.duration;
  req.canvas = job.canvas;
  req.output_path = (fs::path(output_dir) / job.output_name).string();
  return req;
}

} // namespace loopweave
