#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "display_id.h"

// Font sizes available on every panel.
enum class FontSize : uint8_t {
  Tiny,    // 9 px
  Small,   // 12 px
  Medium,  // 18 px
  Large,   // 24 px
  Huge     // 56 px
};

// Anchor point of a text command.
enum class TextAlign : uint8_t {
  TopLeft,
  TopCenter,
  TopRight,
  MiddleLeft,
  MiddleCenter,
  MiddleRight
};

enum class DrawKind : uint8_t {
  FillRect,
  Line,
  FillCircle,
  FillArc,
  Text
};

// A single drawing command. Unused fields stay zero so that equality of two
// frames is a field-by-field comparison.
struct DrawOp {
  DrawKind kind = DrawKind::FillRect;
  int16_t x0 = 0;
  int16_t y0 = 0;
  int16_t x1 = 0;
  int16_t y1 = 0;
  // Line thickness, circle radius, or arc outer radius.
  int16_t size = 0;
  // Arc inner radius.
  int16_t inner = 0;
  // Arc start/end angles in degrees, clockwise from 3 o'clock.
  int16_t angle0 = 0;
  int16_t angle1 = 0;
  uint16_t color = 0;
  FontSize font = FontSize::Small;
  TextAlign align = TextAlign::TopLeft;
  std::string text;

  bool operator==(const DrawOp &other) const;
  bool operator!=(const DrawOp &other) const { return !(*this == other); }
};

// Full frame for one panel: resolution, background, ordered commands.
// Rasterised by the display driver; never cached between cycles.
class RenderedImage {
 public:
  RenderedImage(DisplayId target, uint16_t background);

  DisplayId target() const { return target_; }
  int width() const { return width_; }
  int height() const { return height_; }
  uint16_t background() const { return background_; }
  const std::vector<DrawOp> &ops() const { return ops_; }

  void fillRect(int x, int y, int w, int h, uint16_t color);
  void drawLine(int x0, int y0, int x1, int y1, uint16_t color, int thickness = 1);
  void fillCircle(int x, int y, int r, uint16_t color);
  void fillArc(int x, int y, int innerR, int outerR, int angle0, int angle1, uint16_t color);
  void drawText(const std::string &text, int x, int y, FontSize font, TextAlign align,
                uint16_t color);

  // True when some text command renders exactly `text`.
  bool containsText(const std::string &text) const;

  bool operator==(const RenderedImage &other) const;
  bool operator!=(const RenderedImage &other) const { return !(*this == other); }

 private:
  DisplayId target_;
  int width_;
  int height_;
  uint16_t background_;
  std::vector<DrawOp> ops_;
};
