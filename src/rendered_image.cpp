#include "rendered_image.h"

bool DrawOp::operator==(const DrawOp &other) const {
  return kind == other.kind && x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
         y1 == other.y1 && size == other.size && inner == other.inner &&
         angle0 == other.angle0 && angle1 == other.angle1 && color == other.color &&
         font == other.font && align == other.align && text == other.text;
}

RenderedImage::RenderedImage(DisplayId target, uint16_t background)
    : target_(target),
      width_(displayWidth(target)),
      height_(displayHeight(target)),
      background_(background) {}

void RenderedImage::fillRect(int x, int y, int w, int h, uint16_t color) {
  DrawOp op;
  op.kind = DrawKind::FillRect;
  op.x0 = static_cast<int16_t>(x);
  op.y0 = static_cast<int16_t>(y);
  op.x1 = static_cast<int16_t>(w);
  op.y1 = static_cast<int16_t>(h);
  op.color = color;
  ops_.push_back(op);
}

void RenderedImage::drawLine(int x0, int y0, int x1, int y1, uint16_t color, int thickness) {
  DrawOp op;
  op.kind = DrawKind::Line;
  op.x0 = static_cast<int16_t>(x0);
  op.y0 = static_cast<int16_t>(y0);
  op.x1 = static_cast<int16_t>(x1);
  op.y1 = static_cast<int16_t>(y1);
  op.size = static_cast<int16_t>(thickness);
  op.color = color;
  ops_.push_back(op);
}

void RenderedImage::fillCircle(int x, int y, int r, uint16_t color) {
  DrawOp op;
  op.kind = DrawKind::FillCircle;
  op.x0 = static_cast<int16_t>(x);
  op.y0 = static_cast<int16_t>(y);
  op.size = static_cast<int16_t>(r);
  op.color = color;
  ops_.push_back(op);
}

void RenderedImage::fillArc(int x, int y, int innerR, int outerR, int angle0, int angle1,
                            uint16_t color) {
  DrawOp op;
  op.kind = DrawKind::FillArc;
  op.x0 = static_cast<int16_t>(x);
  op.y0 = static_cast<int16_t>(y);
  op.inner = static_cast<int16_t>(innerR);
  op.size = static_cast<int16_t>(outerR);
  op.angle0 = static_cast<int16_t>(angle0);
  op.angle1 = static_cast<int16_t>(angle1);
  op.color = color;
  ops_.push_back(op);
}

void RenderedImage::drawText(const std::string &text, int x, int y, FontSize font,
                             TextAlign align, uint16_t color) {
  DrawOp op;
  op.kind = DrawKind::Text;
  op.x0 = static_cast<int16_t>(x);
  op.y0 = static_cast<int16_t>(y);
  op.font = font;
  op.align = align;
  op.color = color;
  op.text = text;
  ops_.push_back(op);
}

bool RenderedImage::containsText(const std::string &text) const {
  for (const auto &op : ops_) {
    if (op.kind == DrawKind::Text && op.text == text) return true;
  }
  return false;
}

bool RenderedImage::operator==(const RenderedImage &other) const {
  return target_ == other.target_ && width_ == other.width_ && height_ == other.height_ &&
         background_ == other.background_ && ops_ == other.ops_;
}
