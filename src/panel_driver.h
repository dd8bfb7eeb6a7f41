#pragma once

#include <Arduino.h>
#include <M5GFX.h>
#include <lgfx/v1/panel/Panel_ST7735.hpp>
#include <lgfx/v1/panel/Panel_ST7789.hpp>

#include "display_driver.h"

// 1.3" ST7789 240x240 on the shared SPI bus.
class MainPanel : public lgfx::LGFX_Device {
 public:
  MainPanel();

 private:
  lgfx::Bus_SPI bus_;
  lgfx::Panel_ST7789 panel_;
  lgfx::Light_PWM light_;
};

// 0.96" ST7735S 160x80 on the shared SPI bus.
class SidePanel : public lgfx::LGFX_Device {
 public:
  SidePanel(int8_t pinCs, int8_t pinDc, int8_t pinRst, int8_t pinBl, uint8_t pwmChannel);

 private:
  lgfx::Bus_SPI bus_;
  lgfx::Panel_ST7735S panel_;
  lgfx::Light_PWM light_;
};

// The three physical panels. Each frame is composed in an off-screen RGB565
// sprite and pushed in one transfer.
class PanelDriver : public DisplayDriver {
 public:
  PanelDriver();

  // Initialise all panels and show the boot splash. Returns false if any
  // panel failed; the others stay usable.
  bool begin();

  bool pushImage(DisplayId id, const RenderedImage &image) override;
  bool setBacklight(DisplayId id, uint8_t level) override;

  void showMessage(DisplayId id, const char *line1, const char *line2 = nullptr);

  // Configuration error on the main panel; side panels go dark.
  void showFatal(const char *reason);

  // Blank every panel and switch the backlights off.
  void shutdown();

 private:
  lgfx::LGFX_Device &device(DisplayId id);
  M5Canvas &canvas(DisplayId id);
  void replay(M5Canvas &canvas, const RenderedImage &image);

  MainPanel main_;
  SidePanel left_;
  SidePanel right_;
  M5Canvas mainCanvas_;
  M5Canvas leftCanvas_;
  M5Canvas rightCanvas_;
  bool ready_[DISPLAY_COUNT] = {false, false, false};
};
