/**
 * @file frame_sampler.hpp
 * @brief Decodes single frames of a produced file and fingerprints them
 *
 * @details The FrameSampler seeks to a timestamp, decodes forward to the
 *          first frame at or after it and hashes the frame's pixel planes
 *          with SHA-256 (libavutil hash API). Two frames have equal digests
 *          only if their decoded pixels are identical.
 *
 * @attention THREAD MODEL:
 *            - Each verification creates its own FrameSampler instance.
 *
 *            - FFmpeg decoder state is not thread-safe.
 */

#ifndef LOOPWEAVE_FRAME_SAMPLER_HPP
#define LOOPWEAVE_FRAME_SAMPLER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <string>

namespace loopweave {

/**
 * @struct FrameFingerprint
 * @brief Digest of one decoded frame and where it actually came from.
 */
struct FrameFingerprint {
  double requested_time;
  double decoded_time;
  std::string sha256;
};

/**
 * @brief SHA-256 over the visible bytes of every plane of a frame.
 *
 * @note Row padding (linesize beyond the visible width) is excluded, so the
 *       digest does not depend on decoder alignment.
 *
 * @throws IntegrityError if the pixel format is unknown or the hash cannot
 *         be allocated
 */
std::string frame_sha256(const AVFrame *frame);

/**
 * @class FrameSampler
 * @brief Random-access frame decoder over one file.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - All FFmpeg resources are freed in reverse allocation order
 */
class FrameSampler {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVFrame *last = nullptr; //< Latest frame before the target
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;
  std::string path_;

  /// Decode forward from the current position to the first frame >= t
  bool decode_until(double t, double &decoded_time);

  /// Free everything allocated so far (safe on partial initialization)
  void release();

public:
  /**
   * @brief Open the file and its video decoder.
   * @throws IntegrityError if the file or its video stream cannot be opened
   */
  explicit FrameSampler(const std::string &path);
  ~FrameSampler();

  FrameSampler(const FrameSampler &) = delete;
  FrameSampler &operator=(const FrameSampler &) = delete;

  /// Container duration in seconds (0 if unknown)
  double get_duration() const;

  /// Duration of the video stream alone, falling back to the container
  double get_video_duration() const;

  /// Average frame rate of the video stream
  double get_fps() const;

  int width() const { return dec_ctx->width; }
  int height() const { return dec_ctx->height; }

  /**
   * @brief Decode the frame shown at time t and fingerprint it.
   * @throws IntegrityError if no frame can be decoded at or after t
   */
  FrameFingerprint fingerprint_at(double t);
};

} // namespace loopweave

#endif // LOOPWEAVE_FRAME_SAMPLER_HPP
