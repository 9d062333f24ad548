/**
 * @file overlay_renderer.hpp
 * @brief Rasterizes overlay segments into canvas-sized transparent PNGs
 *
 * @details Each segment becomes one RGBA image the size of the canvas:
 *
 *          - a semi-transparent panel spanning the canvas width
 *
 *          - the wrapped text lines, each centred from its measured width
 *
 *          - an optional reference line in a smaller italic face
 *
 *          The whole text block (not just its first line) is centred
 *          vertically. Composition places every layer at 0:0, so all layers
 *          of a run share the canvas size exactly.
 *
 * @attention THREAD MODEL:
 *            One OverlayRenderer per run. Each instance owns its own
 *            FreeType library handle, so concurrent runs never share glyph
 *            state.
 */

#ifndef LOOPWEAVE_OVERLAY_RENDERER_HPP
#define LOOPWEAVE_OVERLAY_RENDERER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace loopweave {

// **----- OPTIONS -----**

struct RenderOptions {
  std::string font_path;           //< Verse face (TrueType/OpenType file)
  std::string reference_font_path; //< Reference face
  std::string font_family;         //< Fontconfig fallback family
  int wrap_width_chars = 50;       //< Maximum characters per line
  int panel_alpha = 120;           //< Panel opacity 0-255

  static RenderOptions from_config();
};

// **----- IMAGE -----**

/**
 * @struct RgbaImage
 * @brief Straight-alpha RGBA pixel buffer, rows packed without padding.
 */
struct RgbaImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels;

  RgbaImage() = default;
  RgbaImage(int w, int h)
      : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 0) {}

  /// Blend a colour over the pixel at (x, y); coverage scales the alpha
  void blend(int x, int y, const uint8_t rgba[4], uint8_t coverage);

  /// Blend a filled rectangle [x0, x1) x [y0, y1), clipped to the image
  void fill_rect(int x0, int y0, int x1, int y1, const uint8_t rgba[4]);
};

/**
 * @brief Encode an RGBA image as PNG with libavcodec and write it.
 * @throws RenderError on encoder or file failure
 */
void write_png(const RgbaImage &image, const std::string &path);

// **----- TEXT LAYOUT -----**

/**
 * @brief Greedy word wrap to at most width_chars code points per line.
 *
 * @note Breaks at whitespace; explicit newlines start a new paragraph;
 *       words longer than the width are split across lines.
 */
std::vector<std::string> wrap_text(const std::string &text, int width_chars);

/// Number of UTF-8 code points in a string
size_t utf8_length(const std::string &s);

struct LineMetrics {
  std::string text;
  int width; //< Measured pixel width
};

struct PlacedLine {
  std::string text;
  int x;        //< Left edge of the pen
  int baseline; //< Baseline y
  bool reference;
};

/**
 * @struct TextBlockLayout
 * @brief Final placement of every line and of the backing panel.
 */
struct TextBlockLayout {
  std::vector<PlacedLine> lines;
  int block_top = 0;
  int block_bottom = 0;
  int panel_top = 0;
  int panel_bottom = 0;
};

struct FaceMetrics {
  int line_height; //< Baseline-to-baseline distance
  int ascender;    //< Baseline offset from the line top
};

/**
 * @brief Centre a block of verse lines plus an optional reference line.
 *
 * @param verse Verse lines with measured widths
 * @param verse_face Metrics of the verse face
 * @param reference Optional reference line
 * @param reference_face Metrics of the reference face
 * @return Placement; the block's vertical centre is the canvas centre
 */
TextBlockLayout layout_text_block(const Canvas &canvas,
                                  const std::vector<LineMetrics> &verse,
                                  const FaceMetrics &verse_face,
                                  const std::optional<LineMetrics> &reference,
                                  const FaceMetrics &reference_face);

// **----- FONTS -----**

/**
 * @brief Locate a font file for a family through fontconfig.
 * @return File path, or empty string when fontconfig has no match
 */
std::string match_system_font(const std::string &family, bool italic);

/**
 * @class FontFace
 * @brief A FreeType face at a fixed pixel size.
 * @note Owns its FT_Library; not copyable.
 */
class FontFace {
public:
  /**
   * @brief Load a face from a file.
   * @throws RenderError if the file cannot be loaded as a font
   */
  FontFace(const std::string &path, int pixel_size);
  ~FontFace();

  FontFace(const FontFace &) = delete;
  FontFace &operator=(const FontFace &) = delete;

  /// Change the pixel size (used to shrink text that would not fit)
  void set_pixel_size(int pixel_size);

  int pixel_size() const { return pixel_size_; }
  const std::string &path() const { return path_; }
  FaceMetrics metrics() const;

  /// Horizontal advance of a line in pixels, kerning included
  int measure(const std::string &line) const;

  /// Rasterize a line with its pen starting at (x, baseline)
  void draw(RgbaImage &image, const std::string &line, int x, int baseline,
            const uint8_t rgba[4]) const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::string path_;
  int pixel_size_ = 0;
};

/**
 * @brief Open the configured font, falling back to the system font.
 *
 * @details Order: preferred file, then the fontconfig match for family.
 *          The fallback is logged, not fatal.
 *
 * @throws RenderError only if neither source yields a usable face
 */
std::unique_ptr<FontFace> open_font_with_fallback(const std::string &preferred,
                                                  const std::string &family,
                                                  bool italic, int pixel_size);

// **----- RENDERER -----**

/**
 * @class OverlayRenderer
 * @brief Produces one RenderedOverlay per segment for a single run.
 */
class OverlayRenderer {
public:
  /**
   * @param canvas Canvas shared by all layers of the run
   * @param work_dir Run-private directory receiving the PNGs
   * @param options Fonts, wrapping and panel opacity
   * @throws RenderError if no font can be opened at all
   */
  OverlayRenderer(Canvas canvas, std::string work_dir, RenderOptions options);
  ~OverlayRenderer();

  OverlayRenderer(const OverlayRenderer &) = delete;
  OverlayRenderer &operator=(const OverlayRenderer &) = delete;

  /**
   * @brief Render one segment to <work_dir>/overlay_<index>.png.
   * @throws RenderError on empty text or write failure
   */
  RenderedOverlay render(const OverlaySegment &segment);

  std::vector<RenderedOverlay>
  render_all(const std::vector<OverlaySegment> &segments);

  /// Build the in-memory layer without writing it
  RgbaImage rasterize(const OverlaySegment &segment);

  /// Deterministic path for a segment index
  static std::string overlay_path(const std::string &work_dir, int index);

private:
  Canvas canvas_;
  std::string work_dir_;
  RenderOptions options_;
  int verse_size_;
  int reference_size_;
  std::unique_ptr<FontFace> verse_font_;
  std::unique_ptr<FontFace> reference_font_;
};

} // namespace loopweave

#endif // LOOPWEAVE_OVERLAY_RENDERER_HPP
