/**
 * @file frame_sampler.cpp
 * @brief Frame decoding and fingerprinting implementation
 */

#include "loopweave/frame_sampler.hpp"

#include <cmath>

extern "C" {
#include <libavutil/hash.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

#include <fmt/core.h>

#include "loopweave/errors.hpp"

namespace loopweave {

namespace {

/// Frees the hash context on scope exit
struct HashGuard {
  AVHashContext *ctx = nullptr;
  ~HashGuard() { av_hash_freep(&ctx); }
};

} // anonymous namespace

std::string frame_sha256(const AVFrame *f) {
  const AVPixelFormat pix_fmt = static_cast<AVPixelFormat>(f->format);
  const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(pix_fmt);
  if (!desc || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL))
    throw IntegrityError(fmt::format("cannot hash pixel format {}", f->format));

  HashGuard h;
  if (av_hash_alloc(&h.ctx, "SHA256") < 0)
    throw IntegrityError("cannot allocate SHA-256 context");
  av_hash_init(h.ctx);

  const int planes = av_pix_fmt_count_planes(pix_fmt);
  for (int p = 0; p < planes; ++p) {
    const int row_bytes = av_image_get_linesize(pix_fmt, f->width, p);
    /// Planes 1 and 2 carry chroma; round the height up like the decoder
    const int rows = (p == 1 || p == 2)
                         ? -((-f->height) >> desc->log2_chroma_h)
                         : f->height;
    if (row_bytes <= 0 || !f->data[p])
      continue;
    for (int y = 0; y < rows; ++y)
      av_hash_update(h.ctx,
                     f->data[p] + static_cast<ptrdiff_t>(y) * f->linesize[p],
                     row_bytes);
  }

  char hex[2 * AV_HASH_MAX_SIZE + 1] = {0};
  av_hash_final_hex(h.ctx, reinterpret_cast<uint8_t *>(hex), sizeof(hex));
  return std::string(hex);
}

FrameSampler::FrameSampler(const std::string &path) : path_(path) {
  frame = av_frame_alloc();
  last = av_frame_alloc();
  pkt = av_packet_alloc();
  if (!frame || !last || !pkt) {
    release();
    throw IntegrityError("out of memory allocating decoder buffers", path);
  }

  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    release();
    throw IntegrityError("cannot open produced file", path, av_error_text(ret));
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    release();
    throw IntegrityError("cannot read stream info", path, av_error_text(ret));
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    release();
    throw IntegrityError("produced file has no video stream", path);
  }

  /// Only the video stream is decoded
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx))
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
  }

  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    release();
    throw IntegrityError(fmt::format("no decoder for codec id {}",
                                     static_cast<int>(param->codec_id)),
                         path);
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    release();
    throw IntegrityError("cannot allocate decoder context", path);
  }
  avcodec_parameters_to_context(dec_ctx, param);

  /// Full-quality decode: the digest must reflect the real pixels
  dec_ctx->thread_count = 1;

  ret = avcodec_open2(dec_ctx, codec, nullptr);
  if (ret < 0) {
    release();
    throw IntegrityError("cannot open decoder", path, av_error_text(ret));
  }
}

FrameSampler::~FrameSampler() { release(); }

void FrameSampler::release() {
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  av_packet_free(&pkt);
  av_frame_free(&last);
  av_frame_free(&frame);
}

double FrameSampler::get_duration() const {
  return (fmt_ctx->duration != AV_NOPTS_VALUE)
             ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
             : 0.0;
}

double FrameSampler::get_video_duration() const {
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  if (st->duration != AV_NOPTS_VALUE && st->duration > 0)
    return st->duration * av_q2d(st->time_base);
  return get_duration();
}

double FrameSampler::get_fps() const {
  AVRational r = fmt_ctx->streams[video_stream_idx]->avg_frame_rate;
  if (r.num <= 0 || r.den <= 0)
    r = fmt_ctx->streams[video_stream_idx]->r_frame_rate;
  return (r.num > 0 && r.den > 0) ? av_q2d(r) : 0.0;
}

bool FrameSampler::decode_until(double t, double &decoded_time) {
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  const double time_base = av_q2d(st->time_base);
  const double start_time =
      st->start_time != AV_NOPTS_VALUE ? st->start_time * time_base : 0.0;
  const double fps = get_fps();
  /// A frame is "at" t if it starts within half a frame of it
  const double slack = fps > 0.0 ? 0.5 / fps : 0.0;

  av_frame_unref(last);

  auto frame_time = [&](const AVFrame *f) {
    int64_t ts = f->best_effort_timestamp;
    if (ts == AV_NOPTS_VALUE)
      ts = f->pts;
    return ts == AV_NOPTS_VALUE ? -1.0 : ts * time_base - start_time;
  };

  bool flushing = false;
  while (true) {
    if (!flushing) {
      int ret = av_read_frame(fmt_ctx, pkt);
      if (ret < 0) {
        /// End of file: drain what the decoder still holds
        ret = avcodec_send_packet(dec_ctx, nullptr);
        flushing = true;
      } else {
        if (pkt->stream_index == video_stream_idx)
          ret = avcodec_send_packet(dec_ctx, pkt);
        av_packet_unref(pkt);
      }
      if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF)
        throw IntegrityError(fmt::format("decode error near {:.3f}s", t),
                             path_, av_error_text(ret));
    }

    while (true) {
      int ret = avcodec_receive_frame(dec_ctx, frame);
      if (ret == AVERROR(EAGAIN))
        break;
      if (ret < 0) {
        /// Decoder fully drained; the last frame still covers t if it is
        /// within one frame interval of it
        if (last->data[0]) {
          double lt = frame_time(last);
          if (fps > 0.0 && t - lt <= 1.0 / fps + slack) {
            av_frame_move_ref(frame, last);
            decoded_time = lt;
            return true;
          }
        }
        return false;
      }

      double ft = frame_time(frame);
      if (ft >= t - slack) {
        decoded_time = ft;
        return true;
      }
      av_frame_unref(last);
      av_frame_move_ref(last, frame);
    }
  }
}

FrameFingerprint FrameSampler::fingerprint_at(double t) {
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  const double time_base = av_q2d(st->time_base);
  const double start_time =
      st->start_time != AV_NOPTS_VALUE ? st->start_time * time_base : 0.0;

  /// Seek to the key frame at or before t, then decode forward
  int64_t seek_ts = static_cast<int64_t>((t + start_time) / time_base);
  int ret = av_seek_frame(fmt_ctx, video_stream_idx, seek_ts,
                          AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    throw IntegrityError(fmt::format("seek to {:.3f}s failed", t), path_,
                         av_error_text(ret));
  }
  avcodec_flush_buffers(dec_ctx);

  double decoded_time = 0.0;
  if (!decode_until(t, decoded_time)) {
    throw IntegrityError(fmt::format("no frame decodable at {:.3f}s", t),
                         path_);
  }

  FrameFingerprint fp{t, decoded_time, frame_sha256(frame)};
  av_frame_unref(frame);
  return fp;
}

} // namespace loopweave
