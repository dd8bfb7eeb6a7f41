#pragma once

#include <stdint.h>

#include "station_config.h"

enum class DisplayId : uint8_t {
  Main = 0,
  Left = 1,
  Right = 2
};

constexpr uint8_t DISPLAY_COUNT = 3;

constexpr DisplayId ALL_DISPLAYS[DISPLAY_COUNT] = {DisplayId::Main, DisplayId::Left,
                                                   DisplayId::Right};

inline const char *displayName(DisplayId id) {
  switch (id) {
    case DisplayId::Main: return "main";
    case DisplayId::Left: return "left";
    case DisplayId::Right: return "right";
    default: return "?";
  }
}

inline int displayWidth(DisplayId id) {
  return id == DisplayId::Main ? MAIN_PANEL_WIDTH : SIDE_PANEL_WIDTH;
}

inline int displayHeight(DisplayId id) {
  return id == DisplayId::Main ? MAIN_PANEL_HEIGHT : SIDE_PANEL_HEIGHT;
}

inline uint8_t displayIndex(DisplayId id) { return static_cast<uint8_t>(id); }
