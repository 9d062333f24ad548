/**
 * @file media_probe.cpp
 * @brief Container probing implementation
 */

#include "loopweave/media_probe.hpp"

#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "loopweave/errors.hpp"
#include "loopweave/logging.hpp"

namespace loopweave {

namespace {

/// Closes the format context on scope exit
struct FormatGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

/**
 * @brief Duration of the selected stream.
 * @note The container duration spans every stream, so a clip whose audio
 *       runs past its video would report the longer one. It is only used
 *       when the stream carries no duration of its own.
 */
double stream_duration(const AVFormatContext *ctx, const AVStream *st) {
  if (st && st->duration != AV_NOPTS_VALUE && st->duration > 0)
    return st->duration * av_q2d(st->time_base);
  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0)
    return ctx->duration / static_cast<double>(AV_TIME_BASE);
  return 0.0;
}

} // anonymous namespace

MediaAsset probe_media(const std::string &path, MediaKind kind) {
  FormatGuard guard;

  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0)
    throw InputError("cannot open media file", path, av_error_text(ret));

  ret = avformat_find_stream_info(guard.ctx, nullptr);
  if (ret < 0)
    throw InputError("cannot read stream info", path, av_error_text(ret));

  const AVMediaType wanted =
      kind == MediaKind::Video ? AVMEDIA_TYPE_VIDEO : AVMEDIA_TYPE_AUDIO;
  int idx = av_find_best_stream(guard.ctx, wanted, -1, -1, nullptr, 0);
  if (idx < 0) {
    throw InputError(kind == MediaKind::Video ? "no video stream"
                                              : "no audio stream",
                     path, av_error_text(idx));
  }
  const AVStream *st = guard.ctx->streams[idx];

  MediaAsset asset;
  asset.path = path;
  asset.kind = kind;
  asset.duration = stream_duration(guard.ctx, st);

  if (kind == MediaKind::Video) {
    asset.width = st->codecpar->width;
    asset.height = st->codecpar->height;
    AVRational r = st->avg_frame_rate;
    if (r.num <= 0 || r.den <= 0)
      r = st->r_frame_rate;
    asset.fps = (r.num > 0 && r.den > 0) ? av_q2d(r) : 0.0;
  }

  if (!std::isfinite(asset.duration) || asset.duration <= 0.0)
    throw InputError("media reports no positive duration", path);

  LOG_INFO("Probed {} ({:.3f}s{})", path, asset.duration,
           kind == MediaKind::Video
               ? fmt::format(", {}x{} @ {:.2f}fps", asset.width, asset.height,
                             asset.fps)
               : std::string());
  return asset;
}

std::optional<Canvas> probe_image_size(const std::string &path) {
  FormatGuard guard;
  if (avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr) < 0)
    return std::nullopt;
  if (avformat_find_stream_info(guard.ctx, nullptr) < 0)
    return std::nullopt;

  int idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (idx < 0)
    return std::nullopt;

  const AVCodecParameters *par = guard.ctx->streams[idx]->codecpar;
  return Canvas{par->width, par->height};
}

} // namespace loopweave
