/**
 * @file overlay_renderer.cpp
 * @brief Overlay rasterization, layout and PNG output
 *
 * @details Glyphs come from FreeType, the fallback font from fontconfig and
 *          the PNG bytes from libavcodec's PNG encoder, so overlay files are
 *          produced by the same FFmpeg build that later composites them.
 */

#include "loopweave/overlay_renderer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
}

#include <fontconfig/fontconfig.h>
#include <ft2build.h>
#include FT_FREETYPE_H

#include <fmt/core.h>

#include "loopweave/config.hpp"
#include "loopweave/errors.hpp"
#include "loopweave/logging.hpp"

namespace loopweave {

namespace fs = std::filesystem;

namespace {

/// Font sizes at 1080 lines; scaled with canvas height
constexpr int VERSE_PX_AT_1080 = 52;
constexpr int REFERENCE_PX_AT_1080 = 36;

/// Widest a line may be, as a fraction of the canvas width
constexpr double MAX_LINE_FRACTION = 0.9;

const uint8_t VERSE_COLOR[4] = {255, 255, 255, 255};
const uint8_t REFERENCE_COLOR[4] = {200, 200, 200, 255};

/// Decode UTF-8 into code points; malformed bytes become U+FFFD
std::vector<char32_t> decode_utf8(const std::string &s) {
  std::vector<char32_t> out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    int extra = 0;
    char32_t cp = 0;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F;
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F;
      extra = 2;
    } else if ((c & 0xF8) == 0xF0) {
      cp = c & 0x07;
      extra = 3;
    } else {
      out.push_back(0xFFFD);
      ++i;
      continue;
    }
    if (i + extra >= s.size()) {
      out.push_back(0xFFFD);
      break;
    }
    bool ok = true;
    for (int k = 1; k <= extra; ++k) {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) {
        ok = false;
        break;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) {
      out.push_back(0xFFFD);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

/// Byte offset of the n-th code point (or size() if past the end)
size_t utf8_offset(const std::string &s, size_t n) {
  size_t count = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      if (count == n)
        return i;
      ++count;
    }
  }
  return s.size();
}

int scaled_size(int px_at_1080, int canvas_height) {
  return std::max(8, px_at_1080 * canvas_height / 1080);
}

} // anonymous namespace

// **---- RenderOptions ----**

RenderOptions RenderOptions::from_config() {
  RenderOptions o;
  o.font_path = Config::font_path();
  o.reference_font_path = Config::reference_font_path();
  o.font_family = Config::font_family();
  o.wrap_width_chars = Config::wrap_width_chars();
  o.panel_alpha = Config::panel_alpha();
  return o;
}

// **---- RgbaImage ----**

void RgbaImage::blend(int x, int y, const uint8_t rgba[4], uint8_t coverage) {
  if (x < 0 || y < 0 || x >= width || y >= height || coverage == 0)
    return;
  uint8_t *px = &pixels[(static_cast<size_t>(y) * width + x) * 4];

  /// Straight-alpha "source over"
  const double sa = (rgba[3] / 255.0) * (coverage / 255.0);
  const double da = px[3] / 255.0;
  const double oa = sa + da * (1.0 - sa);
  if (oa <= 0.0)
    return;
  for (int c = 0; c < 3; ++c) {
    double v = (rgba[c] * sa + px[c] * da * (1.0 - sa)) / oa;
    px[c] = static_cast<uint8_t>(std::min(255.0, v + 0.5));
  }
  px[3] = static_cast<uint8_t>(std::min(255.0, oa * 255.0 + 0.5));
}

void RgbaImage::fill_rect(int x0, int y0, int x1, int y1,
                          const uint8_t rgba[4]) {
  x0 = std::max(0, x0);
  y0 = std::max(0, y0);
  x1 = std::min(width, x1);
  y1 = std::min(height, y1);
  for (int y = y0; y < y1; ++y)
    for (int x = x0; x < x1; ++x)
      blend(x, y, rgba, 255);
}

// **---- PNG output ----**

void write_png(const RgbaImage &image, const std::string &path) {
  /// Encoder resources freed in reverse allocation order
  struct EncoderGuard {
    AVCodecContext *ctx = nullptr;
    AVFrame *frame = nullptr;
    AVPacket *pkt = nullptr;
    ~EncoderGuard() {
      av_packet_free(&pkt);
      av_frame_free(&frame);
      avcodec_free_context(&ctx);
    }
  } g;

  const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_PNG);
  if (!codec)
    throw RenderError("PNG encoder not available in this FFmpeg build", path);

  g.ctx = avcodec_alloc_context3(codec);
  g.frame = av_frame_alloc();
  g.pkt = av_packet_alloc();
  if (!g.ctx || !g.frame || !g.pkt)
    throw RenderError("out of memory allocating PNG encoder", path);

  g.ctx->width = image.width;
  g.ctx->height = image.height;
  g.ctx->pix_fmt = AV_PIX_FMT_RGBA;
  g.ctx->time_base = AVRational{1, 1};

  int ret = avcodec_open2(g.ctx, codec, nullptr);
  if (ret < 0)
    throw RenderError("cannot open PNG encoder", path, av_error_text(ret));

  g.frame->format = AV_PIX_FMT_RGBA;
  g.frame->width = image.width;
  g.frame->height = image.height;
  ret = av_frame_get_buffer(g.frame, 0);
  if (ret < 0)
    throw RenderError("cannot allocate frame", path, av_error_text(ret));

  const size_t row_bytes = static_cast<size_t>(image.width) * 4;
  for (int y = 0; y < image.height; ++y) {
    std::memcpy(g.frame->data[0] + static_cast<size_t>(y) * g.frame->linesize[0],
                image.pixels.data() + y * row_bytes, row_bytes);
  }
  g.frame->pts = 0;

  ret = avcodec_send_frame(g.ctx, g.frame);
  if (ret >= 0)
    ret = avcodec_send_frame(g.ctx, nullptr);
  if (ret < 0)
    throw RenderError("PNG encode failed", path, av_error_text(ret));

  std::string bytes;
  while ((ret = avcodec_receive_packet(g.ctx, g.pkt)) >= 0) {
    bytes.append(reinterpret_cast<const char *>(g.pkt->data), g.pkt->size);
    av_packet_unref(g.pkt);
  }
  if (ret != AVERROR_EOF && ret != AVERROR(EAGAIN))
    throw RenderError("PNG encode failed", path, av_error_text(ret));
  if (bytes.empty())
    throw RenderError("PNG encoder produced no data", path);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out)
    throw RenderError("cannot write overlay image", path, std::strerror(errno));
}

// **---- Text layout ----**

size_t utf8_length(const std::string &s) {
  size_t n = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80)
      ++n;
  return n;
}

std::vector<std::string> wrap_text(const std::string &text, int width_chars) {
  const size_t width = static_cast<size_t>(std::max(1, width_chars));
  std::vector<std::string> lines;

  size_t para_start = 0;
  while (para_start <= text.size()) {
    size_t para_end = text.find('\n', para_start);
    if (para_end == std::string::npos)
      para_end = text.size();
    std::string para = text.substr(para_start, para_end - para_start);

    /// Split into words on any whitespace
    std::vector<std::string> words;
    std::string word;
    for (char ch : para) {
      if (is_text_whitespace(ch)) {
        if (!word.empty())
          words.push_back(std::move(word));
        word.clear();
      } else {
        word += ch;
      }
    }
    if (!word.empty())
      words.push_back(std::move(word));

    std::string line;
    for (auto &w : words) {
      /// Words wider than a line are hard-split
      while (utf8_length(w) > width) {
        if (!line.empty()) {
          lines.push_back(line);
          line.clear();
        }
        size_t cut = utf8_offset(w, width);
        lines.push_back(w.substr(0, cut));
        w.erase(0, cut);
      }
      if (w.empty())
        continue;
      if (line.empty()) {
        line = w;
      } else if (utf8_length(line) + 1 + utf8_length(w) <= width) {
        line += ' ';
        line += w;
      } else {
        lines.push_back(line);
        line = w;
      }
    }
    if (!line.empty())
      lines.push_back(line);

    para_start = para_end + 1;
  }
  return lines;
}

TextBlockLayout layout_text_block(const Canvas &canvas,
                                  const std::vector<LineMetrics> &verse,
                                  const FaceMetrics &verse_face,
                                  const std::optional<LineMetrics> &reference,
                                  const FaceMetrics &reference_face) {
  TextBlockLayout layout;

  const int gap = reference ? verse_face.line_height / 3 : 0;
  const int block_height =
      static_cast<int>(verse.size()) * verse_face.line_height +
      (reference ? gap + reference_face.line_height : 0);

  layout.block_top = (canvas.height - block_height) / 2;
  layout.block_bottom = layout.block_top + block_height;

  int line_top = layout.block_top;
  for (const auto &l : verse) {
    layout.lines.push_back({l.text, std::max(0, (canvas.width - l.width) / 2),
                            line_top + verse_face.ascender, false});
    line_top += verse_face.line_height;
  }
  if (reference) {
    line_top += gap;
    layout.lines.push_back(
        {reference->text, std::max(0, (canvas.width - reference->width) / 2),
         line_top + reference_face.ascender, true});
  }

  const int pad = canvas.height / 20;
  layout.panel_top = std::max(0, layout.block_top - pad);
  layout.panel_bottom = std::min(canvas.height, layout.block_bottom + pad);
  return layout;
}

// **---- Fonts ----**

std::string match_system_font(const std::string &family, bool italic) {
  if (!FcInit())
    return {};

  FcPattern *pattern =
      FcNameParse(reinterpret_cast<const FcChar8 *>(family.c_str()));
  if (!pattern)
    return {};
  if (italic)
    FcPatternAddInteger(pattern, FC_SLANT, FC_SLANT_ITALIC);
  FcConfigSubstitute(nullptr, pattern, FcMatchPattern);
  FcDefaultSubstitute(pattern);

  FcResult result = FcResultNoMatch;
  FcPattern *match = FcFontMatch(nullptr, pattern, &result);
  std::string path;
  if (match) {
    FcChar8 *file = nullptr;
    if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file)
      path = reinterpret_cast<const char *>(file);
    FcPatternDestroy(match);
  }
  FcPatternDestroy(pattern);
  return path;
}

struct FontFace::Impl {
  FT_Library library = nullptr;
  FT_Face face = nullptr;

  ~Impl() {
    if (face)
      FT_Done_Face(face);
    if (library)
      FT_Done_FreeType(library);
  }
};

FontFace::FontFace(const std::string &path, int pixel_size)
    : path_(path), pixel_size_(pixel_size) {
  auto impl = std::make_unique<Impl>();

  FT_Error err = FT_Init_FreeType(&impl->library);
  if (err)
    throw RenderError("cannot initialise FreeType", path,
                      fmt::format("FT_Error {}", err));

  err = FT_New_Face(impl->library, path.c_str(), 0, &impl->face);
  if (err)
    throw RenderError("cannot load font", path,
                      fmt::format("FT_Error {}", err));

  err = FT_Set_Pixel_Sizes(impl->face, 0, static_cast<FT_UInt>(pixel_size));
  if (err)
    throw RenderError("font cannot be scaled", path,
                      fmt::format("FT_Error {}", err));

  impl_ = std::move(impl);
}

FontFace::~FontFace() = default;

void FontFace::set_pixel_size(int pixel_size) {
  if (pixel_size == pixel_size_)
    return;
  FT_Error err =
      FT_Set_Pixel_Sizes(impl_->face, 0, static_cast<FT_UInt>(pixel_size));
  if (err)
    throw RenderError(fmt::format("font cannot be scaled to {}px", pixel_size),
                      path_, fmt::format("FT_Error {}", err));
  pixel_size_ = pixel_size;
}

FaceMetrics FontFace::metrics() const {
  const FT_Size_Metrics &m = impl_->face->size->metrics;
  return {static_cast<int>((m.height + 63) >> 6),
          static_cast<int>((m.ascender + 63) >> 6)};
}

int FontFace::measure(const std::string &line) const {
  FT_Face face = impl_->face;
  const bool kerning = FT_HAS_KERNING(face);
  FT_Pos pen = 0;
  FT_UInt prev = 0;

  for (char32_t cp : decode_utf8(line)) {
    FT_UInt glyph = FT_Get_Char_Index(face, cp);
    if (kerning && prev && glyph) {
      FT_Vector delta;
      if (FT_Get_Kerning(face, prev, glyph, FT_KERNING_DEFAULT, &delta) == 0)
        pen += delta.x;
    }
    if (FT_Load_Glyph(face, glyph, FT_LOAD_DEFAULT) == 0)
      pen += face->glyph->advance.x;
    prev = glyph;
  }
  return static_cast<int>((pen + 32) >> 6);
}

void FontFace::draw(RgbaImage &image, const std::string &line, int x,
                    int baseline, const uint8_t rgba[4]) const {
  FT_Face face = impl_->face;
  const bool kerning = FT_HAS_KERNING(face);
  FT_Pos pen = static_cast<FT_Pos>(x) << 6;
  FT_UInt prev = 0;

  for (char32_t cp : decode_utf8(line)) {
    FT_UInt glyph = FT_Get_Char_Index(face, cp);
    if (kerning && prev && glyph) {
      FT_Vector delta;
      if (FT_Get_Kerning(face, prev, glyph, FT_KERNING_DEFAULT, &delta) == 0)
        pen += delta.x;
    }
    prev = glyph;

    FT_Error err = FT_Load_Glyph(face, glyph, FT_LOAD_RENDER);
    if (err) {
      throw RenderError(fmt::format("cannot render glyph U+{:04X}",
                                    static_cast<unsigned>(cp)),
                        path_, fmt::format("FT_Error {}", err));
    }

    const FT_GlyphSlot slot = face->glyph;
    const FT_Bitmap &bm = slot->bitmap;
    const int left = static_cast<int>((pen + 32) >> 6) + slot->bitmap_left;
    const int top = baseline - slot->bitmap_top;

    for (unsigned int r = 0; r < bm.rows; ++r) {
      const unsigned char *row = bm.buffer + static_cast<long>(r) * bm.pitch;
      for (unsigned int c = 0; c < bm.width; ++c) {
        uint8_t coverage = 0;
        if (bm.pixel_mode == FT_PIXEL_MODE_MONO) {
          coverage = ((row[c >> 3] >> (7 - (c & 7))) & 1) ? 255 : 0;
        } else if (bm.num_grays > 1 && bm.num_grays != 256) {
          coverage = static_cast<uint8_t>(row[c] * 255 / (bm.num_grays - 1));
        } else {
          coverage = row[c];
        }
        image.blend(left + static_cast<int>(c), top + static_cast<int>(r),
                    rgba, coverage);
      }
    }
    pen += slot->advance.x;
  }
}

std::unique_ptr<FontFace> open_font_with_fallback(const std::string &preferred,
                                                  const std::string &family,
                                                  bool italic,
                                                  int pixel_size) {
  std::string first_failure;
  if (!preferred.empty()) {
    try {
      return std::make_unique<FontFace>(preferred, pixel_size);
    } catch (const RenderError &e) {
      first_failure = e.what();
    }
  }

  std::string fallback = match_system_font(family, italic);
  if (fallback.empty()) {
    throw RenderError("no usable font", preferred,
                      fmt::format("{}; fontconfig has no match for '{}'",
                                  first_failure, family));
  }
  LOG_WARN("Font '{}' unavailable, using system font {}", preferred, fallback);
  return std::make_unique<FontFace>(fallback, pixel_size);
}

// **---- OverlayRenderer ----**

OverlayRenderer::OverlayRenderer(Canvas canvas, std::string work_dir,
                                 RenderOptions options)
    : canvas_(canvas), work_dir_(std::move(work_dir)),
      options_(std::move(options)),
      verse_size_(scaled_size(VERSE_PX_AT_1080, canvas.height)),
      reference_size_(scaled_size(REFERENCE_PX_AT_1080, canvas.height)) {
  std::error_code ec;
  fs::create_directories(work_dir_, ec);
  if (ec)
    throw RenderError("cannot create overlay directory", work_dir_,
                      ec.message());

  verse_font_ = open_font_with_fallback(options_.font_path,
                                        options_.font_family, false,
                                        verse_size_);
  reference_font_ = open_font_with_fallback(options_.reference_font_path,
                                            options_.font_family, true,
                                            reference_size_);
}

OverlayRenderer::~OverlayRenderer() = default;

std::string OverlayRenderer::overlay_path(const std::string &work_dir,
                                          int index) {
  return (fs::path(work_dir) / fmt::format("overlay_{:04d}.png", index))
      .string();
}

RgbaImage OverlayRenderer::rasterize(const OverlaySegment &segment) {
  const std::string subject = fmt::format("segment {}", segment.sequence_index);
  if (is_blank(segment.text))
    throw RenderError("segment text is empty", subject);

  const int max_width = static_cast<int>(canvas_.width * MAX_LINE_FRACTION);
  std::vector<std::string> wrapped =
      wrap_text(segment.text, options_.wrap_width_chars);

  /// Measure; shrink the face once if the widest line overflows the canvas
  auto measure_all = [&](const FontFace &font) {
    std::vector<LineMetrics> out;
    out.reserve(wrapped.size());
    for (const auto &l : wrapped)
      out.push_back({l, font.measure(l)});
    return out;
  };

  verse_font_->set_pixel_size(verse_size_);
  std::vector<LineMetrics> verse = measure_all(*verse_font_);
  int widest = 0;
  for (const auto &l : verse)
    widest = std::max(widest, l.width);
  if (widest > max_width) {
    verse_font_->set_pixel_size(
        std::max(8, verse_size_ * max_width / widest));
    verse = measure_all(*verse_font_);
  }

  std::optional<LineMetrics> reference;
  reference_font_->set_pixel_size(reference_size_);
  if (!segment.reference.empty()) {
    int w = reference_font_->measure(segment.reference);
    if (w > max_width) {
      reference_font_->set_pixel_size(
          std::max(8, reference_size_ * max_width / w));
      w = reference_font_->measure(segment.reference);
    }
    reference = LineMetrics{segment.reference, w};
  }

  TextBlockLayout layout =
      layout_text_block(canvas_, verse, verse_font_->metrics(), reference,
                        reference_font_->metrics());

  RgbaImage image(canvas_.width, canvas_.height);
  const uint8_t panel[4] = {0, 0, 0,
                            static_cast<uint8_t>(
                                std::clamp(options_.panel_alpha, 0, 255))};
  image.fill_rect(0, layout.panel_top, canvas_.width, layout.panel_bottom,
                  panel);

  for (const auto &line : layout.lines) {
    if (line.reference)
      reference_font_->draw(image, line.text, line.x, line.baseline,
                            REFERENCE_COLOR);
    else
      verse_font_->draw(image, line.text, line.x, line.baseline, VERSE_COLOR);
  }
  return image;
}

RenderedOverlay OverlayRenderer::render(const OverlaySegment &segment) {
  RgbaImage image = rasterize(segment);
  std::string path = overlay_path(work_dir_, segment.sequence_index);
  write_png(image, path);
  return {path, image.width, image.height, segment.sequence_index};
}

std::vector<RenderedOverlay>
OverlayRenderer::render_all(const std::vector<OverlaySegment> &segments) {
  std::vector<RenderedOverlay> out;
  out.reserve(segments.size());
  for (const auto &s : segments) {
    out.push_back(render(s));
    if (segments.size() >= 100 && out.size() % 100 == 0)
      LOG_INFO("Rendered {}/{} overlays", out.size(), segments.size());
  }
  return out;
}

} // namespace loopweave
