/**
 * @file segment_manifest.hpp
 * @brief Parsing of segment manifests and batch job files
 *
 * @details Segment manifest, one segment per line:
 *
 *            [<seconds>|]<verse text>[ - <reference>]
 *
 *          Job file, key = value lines:
 *
 *            background, music, segments, duration, output, width, height,
 *            narration
 *
 *          Blank lines and lines starting with '#' are ignored in both.
 */

#ifndef LOOPWEAVE_SEGMENT_MANIFEST_HPP
#define LOOPWEAVE_SEGMENT_MANIFEST_HPP

#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace loopweave {

/**
 * @brief Split "verse - reference" at the last " - ".
 * @return {verse, reference}; reference is empty when there is none
 */
std::pair<std::string, std::string> split_reference(const std::string &text);

/**
 * @brief Parse a manifest stream.
 * @param source Name used in error messages
 * @throws InputError on a malformed duration prefix
 */
std::vector<OverlaySegment> parse_segments(std::istream &in,
                                           const std::string &source);

/// Open and parse a manifest file; InputError if it cannot be read
std::vector<OverlaySegment> load_segments(const std::string &path);

/**
 * @brief Parse a strictly positive decimal number.
 * @throws InputError naming what if text is not a finite number > 0
 */
double parse_positive(const std::string &text, const std::string &what);

/// Largest accepted canvas side
constexpr int MAX_DIMENSION = 16384;

/**
 * @brief Parse a canvas side: a whole number of pixels in [1, MAX_DIMENSION].
 * @throws InputError naming what otherwise
 */
int parse_dimension(const std::string &text, const std::string &what);

/**
 * @struct JobSpec
 * @brief One batch job, paths already resolved against the job directory.
 */
struct JobSpec {
  std::string name; //< Job file stem
  std::string background;
  std::string music;
  std::string narration;
  std::string segments;
  std::string output_name; //< File name inside the batch output directory
  double duration = 0.0;
  Canvas canvas;
};

/**
 * @brief Parse a job stream.
 * @param job_path Path of the job file (relative paths resolve next to it)
 * @throws InputError on unknown keys, missing keys or bad values
 */
JobSpec parse_job(std::istream &in, const std::string &job_path);

JobSpec load_job(const std::string &job_path);

/// All *.job files of a directory, sorted by name
std::vector<std::string> find_job_files(const std::string &jobs_dir);

/**
 * @brief Turn a job into a run request writing into output_dir.
 * @throws InputError if the manifest cannot be loaded
 */
RunRequest make_request(const JobSpec &job, const std::string &output_dir);

} // namespace loopweave

#endif // LOOPWEAVE_SEGMENT_MANIFEST_HPP
