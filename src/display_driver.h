#pragma once

#include <stdint.h>

#include "display_id.h"
#include "rendered_image.h"

// Hardware boundary for the three panels. Both calls return false on a
// display error; the caller decides whether to carry on.
class DisplayDriver {
 public:
  virtual ~DisplayDriver() = default;

  virtual bool pushImage(DisplayId id, const RenderedImage &image) = 0;

  // level: 0-100 percent.
  virtual bool setBacklight(DisplayId id, uint8_t level) = 0;
};
