#include "panel_driver.h"

#include "board_pins.h"
#include "renderers.h"
#include "station_config.h"

namespace {

constexpr uint32_t kSpiWriteHz = 10000000;
constexpr uint32_t kBacklightPwmHz = 12000;

void configureBus(lgfx::Bus_SPI &bus, int8_t pinDc) {
  auto cfg = bus.config();
  cfg.spi_host = VSPI_HOST;
  cfg.spi_mode = 0;
  cfg.freq_write = kSpiWriteHz;
  cfg.freq_read = 8000000;
  cfg.spi_3wire = true;
  cfg.use_lock = true;
  cfg.dma_channel = SPI_DMA_CH_AUTO;
  cfg.pin_sclk = PANEL_PIN_SCLK;
  cfg.pin_mosi = PANEL_PIN_MOSI;
  cfg.pin_miso = -1;
  cfg.pin_dc = pinDc;
  bus.config(cfg);
}

void configureLight(lgfx::Light_PWM &light, int8_t pinBl, uint8_t channel) {
  auto cfg = light.config();
  cfg.pin_bl = pinBl;
  cfg.invert = false;
  cfg.freq = kBacklightPwmHz;
  cfg.pwm_channel = channel;
  light.config(cfg);
}

const lgfx::IFont *fontFor(FontSize size) {
  switch (size) {
    case FontSize::Tiny: return &fonts::DejaVu9;
    case FontSize::Small: return &fonts::DejaVu12;
    case FontSize::Medium: return &fonts::DejaVu18;
    case FontSize::Large: return &fonts::DejaVu24;
    case FontSize::Huge: return &fonts::DejaVu56;
    default: return &fonts::DejaVu12;
  }
}

lgfx::textdatum_t datumFor(TextAlign align) {
  switch (align) {
    case TextAlign::TopLeft: return TL_DATUM;
    case TextAlign::TopCenter: return TC_DATUM;
    case TextAlign::TopRight: return TR_DATUM;
    case TextAlign::MiddleLeft: return ML_DATUM;
    case TextAlign::MiddleCenter: return MC_DATUM;
    case TextAlign::MiddleRight: return MR_DATUM;
    default: return TL_DATUM;
  }
}

}  // namespace

MainPanel::MainPanel() {
  configureBus(bus_, MAIN_PIN_DC);
  panel_.setBus(&bus_);
  {
    auto cfg = panel_.config();
    cfg.pin_cs = MAIN_PIN_CS;
    cfg.pin_rst = MAIN_PIN_RST;
    cfg.pin_busy = -1;
    cfg.memory_width = 240;
    cfg.memory_height = 320;
    cfg.panel_width = MAIN_PANEL_WIDTH;
    cfg.panel_height = MAIN_PANEL_HEIGHT;
    cfg.offset_x = 0;
    cfg.offset_y = 0;
    cfg.offset_rotation = 0;
    cfg.readable = false;
    cfg.invert = true;
    cfg.rgb_order = false;
    cfg.bus_shared = true;
    panel_.config(cfg);
  }
  configureLight(light_, MAIN_PIN_BL, MAIN_BL_CHANNEL);
  panel_.setLight(&light_);
  setPanel(&panel_);
}

SidePanel::SidePanel(int8_t pinCs, int8_t pinDc, int8_t pinRst, int8_t pinBl,
                     uint8_t pwmChannel) {
  configureBus(bus_, pinDc);
  panel_.setBus(&bus_);
  {
    auto cfg = panel_.config();
    cfg.pin_cs = pinCs;
    cfg.pin_rst = pinRst;
    cfg.pin_busy = -1;
    // Native orientation is portrait 80x160; rotation 1 below makes it 160x80.
    cfg.memory_width = 132;
    cfg.memory_height = 162;
    cfg.panel_width = SIDE_PANEL_HEIGHT;
    cfg.panel_height = SIDE_PANEL_WIDTH;
    cfg.offset_x = 26;
    cfg.offset_y = 1;
    cfg.offset_rotation = 1;
    cfg.readable = false;
    cfg.invert = true;
    cfg.rgb_order = false;
    cfg.bus_shared = true;
    panel_.config(cfg);
  }
  configureLight(light_, pinBl, pwmChannel);
  panel_.setLight(&light_);
  setPanel(&panel_);
}

PanelDriver::PanelDriver()
    : left_(LEFT_PIN_CS, LEFT_PIN_DC, LEFT_PIN_RST, LEFT_PIN_BL, LEFT_BL_CHANNEL),
      right_(RIGHT_PIN_CS, RIGHT_PIN_DC, RIGHT_PIN_RST, RIGHT_PIN_BL, RIGHT_BL_CHANNEL),
      mainCanvas_(&main_),
      leftCanvas_(&left_),
      rightCanvas_(&right_) {}

lgfx::LGFX_Device &PanelDriver::device(DisplayId id) {
  switch (id) {
    case DisplayId::Left: return left_;
    case DisplayId::Right: return right_;
    default: return main_;
  }
}

M5Canvas &PanelDriver::canvas(DisplayId id) {
  switch (id) {
    case DisplayId::Left: return leftCanvas_;
    case DisplayId::Right: return rightCanvas_;
    default: return mainCanvas_;
  }
}

bool PanelDriver::begin() {
  bool allReady = true;
  for (DisplayId id : ALL_DISPLAYS) {
    lgfx::LGFX_Device &dev = device(id);
    bool ok = dev.init();
    if (ok) {
      dev.setBrightness(0);
      dev.fillScreen(TFT_BLACK);

      M5Canvas &cv = canvas(id);
      cv.setColorDepth(16);
      if (!cv.createSprite(displayWidth(id), displayHeight(id))) {
        Serial.printf("Panels: %s sprite allocation failed (%d bytes free)\n", displayName(id),
                      ESP.getFreeHeap());
        ok = false;
      }
    } else {
      Serial.printf("Panels: %s panel did not initialise\n", displayName(id));
    }
    ready_[displayIndex(id)] = ok;
    allReady = allReady && ok;
  }

  for (DisplayId id : ALL_DISPLAYS) {
    if (!ready_[displayIndex(id)]) continue;
    showMessage(id, "Weather", "Waiting for data...");
    setBacklight(id, STATION_DEFAULT_SIDE_BACKLIGHT);
  }
  return allReady;
}

void PanelDriver::replay(M5Canvas &cv, const RenderedImage &image) {
  cv.fillSprite(image.background());
  for (const DrawOp &op : image.ops()) {
    switch (op.kind) {
      case DrawKind::FillRect:
        cv.fillRect(op.x0, op.y0, op.x1, op.y1, op.color);
        break;
      case DrawKind::Line:
        if (op.size <= 1) {
          cv.drawLine(op.x0, op.y0, op.x1, op.y1, op.color);
        } else {
          cv.drawWideLine(op.x0, op.y0, op.x1, op.y1, op.size / 2.0f, op.color);
        }
        break;
      case DrawKind::FillCircle:
        cv.fillCircle(op.x0, op.y0, op.size, op.color);
        break;
      case DrawKind::FillArc:
        cv.fillArc(op.x0, op.y0, op.inner, op.size, op.angle0, op.angle1, op.color);
        break;
      case DrawKind::Text:
        cv.setFont(fontFor(op.font));
        cv.setTextDatum(datumFor(op.align));
        cv.setTextColor(op.color);
        cv.drawString(op.text.c_str(), op.x0, op.y0);
        break;
    }
  }
}

bool PanelDriver::pushImage(DisplayId id, const RenderedImage &image) {
  if (!ready_[displayIndex(id)]) return false;

  M5Canvas &cv = canvas(id);
  if (image.width() != cv.width() || image.height() != cv.height()) {
    Serial.printf("Panels: %s frame is %dx%d, panel is %dx%d\n", displayName(id), image.width(),
                  image.height(), static_cast<int>(cv.width()), static_cast<int>(cv.height()));
    return false;
  }

  replay(cv, image);
  cv.pushSprite(0, 0);
  return true;
}

bool PanelDriver::setBacklight(DisplayId id, uint8_t level) {
  if (!ready_[displayIndex(id)]) return false;
  if (level > 100) level = 100;
  device(id).setBrightness(static_cast<uint8_t>((level * 255U) / 100U));
  return true;
}

void PanelDriver::showMessage(DisplayId id, const char *line1, const char *line2) {
  if (!pushImage(id, renderMessage(id, line1, line2))) {
    Serial.printf("Panels: could not show message on %s\n", displayName(id));
  }
}

void PanelDriver::showFatal(const char *reason) {
  showMessage(DisplayId::Main, "Config error", reason);
  for (DisplayId id : ALL_DISPLAYS) {
    uint8_t level = id == DisplayId::Main ? STATION_DEFAULT_MAIN_BACKLIGHT : 0;
    if (!setBacklight(id, level)) {
      Serial.printf("Panels: %s unavailable for error notice\n", displayName(id));
    }
  }
}

void PanelDriver::shutdown() {
  for (DisplayId id : ALL_DISPLAYS) {
    if (!ready_[displayIndex(id)]) continue;
    lgfx::LGFX_Device &dev = device(id);
    dev.fillScreen(TFT_BLACK);
    dev.setBrightness(0);
  }
}
