#include "renderers.h"

#include <ctype.h>
#include <math.h>
#include <stdio.h>
#include <string.h>

#include "weather_codes.h"

namespace {

constexpr float kPi = 3.14159265f;
const char kDegree[] = "\xC2\xB0";

const uint16_t kBackground = rgb565(10, 10, 14);
const uint16_t kSeparator = rgb565(25, 25, 35);
const uint16_t kCaption = rgb565(50, 50, 65);
const uint16_t kLabel = rgb565(80, 95, 95);
const uint16_t kDate = rgb565(55, 55, 70);
const uint16_t kMuted = rgb565(70, 70, 85);
const uint16_t kUnit = rgb565(80, 80, 95);
const uint16_t kCondition = rgb565(200, 200, 210);
const uint16_t kClock = rgb565(224, 224, 224);
const uint16_t kExtremes = rgb565(255, 160, 80);
const uint16_t kHumidity = rgb565(60, 180, 180);
const uint16_t kWind = rgb565(160, 110, 220);
const uint16_t kHorizon = rgb565(60, 60, 75);
const uint16_t kStale = rgb565(180, 60, 60);

const uint16_t kSunYellow = rgb565(255, 200, 60);
const uint16_t kCloudLight = rgb565(200, 200, 210);
const uint16_t kCloudDark = rgb565(130, 130, 145);
const uint16_t kRainBlue = rgb565(90, 150, 255);
const uint16_t kSnowWhite = rgb565(235, 235, 245);
const uint16_t kBoltYellow = rgb565(255, 220, 40);

int polarX(int cx, float radius, int angleDeg) {
  return cx + static_cast<int>(radius * cosf(angleDeg * kPi / 180.0f));
}

// Math angle (counter-clockwise, y up) onto screen coordinates.
int polarY(int cy, float radius, int angleDeg) {
  return cy - static_cast<int>(radius * sinf(angleDeg * kPi / 180.0f));
}

void drawCloud(RenderedImage &img, int x, int y, uint16_t color) {
  img.fillCircle(x - 12, y, 9, color);
  img.fillCircle(x, y - 6, 12, color);
  img.fillCircle(x + 12, y, 9, color);
  img.fillRect(x - 12, y, 24, 10, color);
}

void drawSun(RenderedImage &img, int x, int y, int r) {
  img.fillCircle(x, y, r, kSunYellow);
  for (int angle = 0; angle < 360; angle += 45) {
    img.drawLine(polarX(x, r + 4, angle), polarY(y, r + 4, angle), polarX(x, r + 10, angle),
                 polarY(y, r + 10, angle), kSunYellow, 2);
  }
}

void drawIcon(RenderedImage &img, WeatherIcon icon, int cx, int cy) {
  switch (icon) {
    case WeatherIcon::Clear:
      drawSun(img, cx, cy, 14);
      break;
    case WeatherIcon::PartlyCloudy:
      drawSun(img, cx - 10, cy - 8, 10);
      drawCloud(img, cx + 6, cy + 6, kCloudLight);
      break;
    case WeatherIcon::Cloudy:
      drawCloud(img, cx, cy, kCloudLight);
      break;
    case WeatherIcon::Fog:
      for (int i = 0; i < 3; ++i) {
        img.drawLine(cx - 20 + i * 4, cy - 10 + i * 10, cx + 20 - i * 4, cy - 10 + i * 10,
                     kCloudDark, 3);
      }
      break;
    case WeatherIcon::Drizzle:
      drawCloud(img, cx, cy - 6, kCloudDark);
      for (int i = -1; i <= 1; ++i) {
        img.drawLine(cx + i * 10, cy + 12, cx + i * 10 - 2, cy + 16, kRainBlue, 2);
      }
      break;
    case WeatherIcon::Rain:
      drawCloud(img, cx, cy - 6, kCloudDark);
      for (int i = -1; i <= 1; ++i) {
        img.drawLine(cx + i * 10, cy + 12, cx + i * 10 - 5, cy + 24, kRainBlue, 2);
      }
      break;
    case WeatherIcon::Snow:
      drawCloud(img, cx, cy - 6, kCloudLight);
      for (int i = -1; i <= 1; ++i) {
        img.fillCircle(cx + i * 10, cy + 16 + (i == 0 ? 4 : 0), 3, kSnowWhite);
      }
      break;
    case WeatherIcon::Thunder:
      drawCloud(img, cx, cy - 6, kCloudDark);
      img.drawLine(cx + 2, cy + 10, cx - 4, cy + 20, kBoltYellow, 3);
      img.drawLine(cx - 4, cy + 20, cx + 4, cy + 20, kBoltYellow, 3);
      img.drawLine(cx + 4, cy + 20, cx - 2, cy + 30, kBoltYellow, 3);
      break;
    case WeatherIcon::Unknown:
    default:
      img.drawText("?", cx, cy, FontSize::Large, TextAlign::MiddleCenter, kMuted);
      break;
  }
}

void drawSunrise(RenderedImage &img, int cx, int cy, int r) {
  const uint16_t sun = rgb565(255, 190, 60);
  const uint16_t ray = rgb565(255, 160, 40);

  img.drawLine(cx - r - 6, cy, cx + r + 6, cy, kHorizon);
  img.fillArc(cx, cy, 0, r, 180, 360, sun);

  const int rayLen = 5;
  const int angles[] = {150, 120, 90, 60, 30};
  for (int angle : angles) {
    img.drawLine(polarX(cx, r + 2, angle), polarY(cy, r + 2, angle),
                 polarX(cx, r + 2 + rayLen, angle), polarY(cy, r + 2 + rayLen, angle), ray, 2);
  }
}

void drawSunset(RenderedImage &img, int cx, int cy, int r) {
  const uint16_t sun = rgb565(255, 120, 50);
  const uint16_t ray = rgb565(255, 90, 40);

  img.drawLine(cx - r - 6, cy, cx + r + 6, cy, kHorizon);
  img.fillArc(cx, cy + 4, 0, r, 200, 340, sun);

  const int rayLen = 4;
  const int angles[] = {140, 110, 70, 40};
  for (int angle : angles) {
    img.drawLine(polarX(cx, r, angle), polarY(cy, r - 2, angle), polarX(cx, r + rayLen, angle),
                 polarY(cy, r - 2 + rayLen, angle), ray, 2);
  }
}

std::string withDegree(float celsius) {
  std::string text = formatTemperature(celsius);
  if (hasValue(celsius)) text += kDegree;
  return text;
}

std::string formatRounded(float value, const char *suffix) {
  if (!hasValue(value)) return "--";
  char buf[16];
  snprintf(buf, sizeof(buf), "%ld%s", lroundf(value), suffix);
  return buf;
}

int dayOfWeek(int y, int m, int d) {
  static const int offsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  if (m < 3) y -= 1;
  return (y + y / 4 - y / 100 + y / 400 + offsets[m - 1] + d) % 7;
}

}  // namespace

std::string formatTemperature(float celsius) {
  if (!hasValue(celsius)) return "--";
  char buf[16];
  snprintf(buf, sizeof(buf), "%.1f", celsius);
  size_t len = strlen(buf);
  if (len >= 2 && buf[len - 2] == '.' && buf[len - 1] == '0') buf[len - 2] = '\0';
  if (strcmp(buf, "-0") == 0) return "0";
  return buf;
}

std::string formatObservedDate(const char *isoDate) {
  static const char *const kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static const char *const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  if (!isoDate || strlen(isoDate) != 10 || isoDate[4] != '-' || isoDate[7] != '-') return "";
  for (int i = 0; i < 10; ++i) {
    if (i == 4 || i == 7) continue;
    if (!isdigit(static_cast<unsigned char>(isoDate[i]))) return "";
  }
  int year = 0, month = 0, day = 0;
  if (sscanf(isoDate, "%4d-%2d-%2d", &year, &month, &day) != 3) return "";
  if (month < 1 || month > 12 || day < 1 || day > 31) return "";

  char buf[16];
  snprintf(buf, sizeof(buf), "%s %02d %s", kDays[dayOfWeek(year, month, day)], day,
           kMonths[month - 1]);
  return buf;
}

RenderedImage MainRenderer::render(const WeatherSnapshot &snapshot,
                                   const StationSettings &settings, bool stale) const {
  RenderedImage img(DisplayId::Main, kBackground);

  if (stale) {
    img.fillCircle(STALE_MARK_X, STALE_MARK_Y, STALE_MARK_RADIUS, kStale);
  }

  // Header: location + date on the left, today's extremes on the right.
  img.drawText(settings.label, 12, 21, FontSize::Small, TextAlign::TopLeft, kLabel);
  std::string date = formatObservedDate(snapshot.observedDate);
  if (!date.empty()) {
    img.drawText(date, 12, 37, FontSize::Tiny, TextAlign::TopLeft, kDate);
  }
  img.drawText("H/L", 196, 12, FontSize::Tiny, TextAlign::TopCenter, kDate);
  std::string extremes = formatTemperature(snapshot.tempHigh);
  extremes += "/";
  extremes += formatTemperature(snapshot.tempLow);
  img.drawText(extremes, 196, 24, FontSize::Medium, TextAlign::TopCenter, kExtremes);

  drawIcon(img, iconForCode(snapshot.conditionCode), 120, 72);

  img.drawText(withDegree(snapshot.temperature), 120, 132, FontSize::Huge,
               TextAlign::MiddleCenter, temperatureColor(snapshot.temperature));

  if (hasValue(snapshot.feelsLike)) {
    img.drawText(std::string("Feels ") + withDegree(snapshot.feelsLike), 120, 170,
                 FontSize::Small, TextAlign::MiddleCenter, kMuted);
  }
  img.drawText(conditionText(snapshot.conditionCode), 120, 190, FontSize::Medium,
               TextAlign::MiddleCenter, kCondition);

  // Footer: UV on the left, observation time in the middle.
  if (hasValue(snapshot.uvIndex)) {
    std::string uv = "UV ";
    uv += formatRounded(snapshot.uvIndex, "");
    img.drawText(uv, 12, 216, FontSize::Medium, TextAlign::TopLeft, uvColor(snapshot.uvIndex));
  }
  if (snapshot.observedTime[0]) {
    img.drawText(snapshot.observedTime, 120, 216, FontSize::Medium, TextAlign::TopCenter, kClock);
  }
  return img;
}

RenderedImage LeftRenderer::render(const WeatherSnapshot &snapshot,
                                   const StationSettings &) const {
  RenderedImage img(DisplayId::Left, kBackground);

  img.drawText("HUM", 8, 8, FontSize::Tiny, TextAlign::TopLeft, kCaption);
  img.drawText(formatRounded(snapshot.humidity, "%"), 40, 30, FontSize::Large,
               TextAlign::TopCenter, kHumidity);

  img.drawLine(80, 10, 80, 70, kSeparator);

  img.drawText("WIND", 88, 8, FontSize::Tiny, TextAlign::TopLeft, kCaption);
  img.drawText(formatRounded(snapshot.windSpeed, ""), 120, 30, FontSize::Large,
               TextAlign::TopCenter, kWind);

  std::string unit = windCompass(snapshot.windDirection);
  if (!unit.empty()) unit += " ";
  unit += "km/h";
  img.drawText(unit, 120, 62, FontSize::Tiny, TextAlign::TopCenter, kUnit);
  return img;
}

RenderedImage RightRenderer::render(const WeatherSnapshot &snapshot,
                                    const StationSettings &) const {
  RenderedImage img(DisplayId::Right, kBackground);

  drawSunrise(img, 40, 28, 14);
  img.drawText(snapshot.sunrise[0] ? snapshot.sunrise : "--:--", 40, 50, FontSize::Small,
               TextAlign::TopCenter, rgb565(255, 190, 80));

  img.drawLine(80, 10, 80, 70, kSeparator);

  drawSunset(img, 120, 28, 14);
  img.drawText(snapshot.sunset[0] ? snapshot.sunset : "--:--", 120, 50, FontSize::Small,
               TextAlign::TopCenter, rgb565(255, 110, 60));
  return img;
}

RenderedImage renderMessage(DisplayId target, const char *line1, const char *line2) {
  RenderedImage img(target, kBackground);
  const int cx = displayWidth(target) / 2;
  const int cy = displayHeight(target) / 2;
  const FontSize font = target == DisplayId::Main ? FontSize::Medium : FontSize::Small;
  if (line2) {
    img.drawText(line1 ? line1 : "", cx, cy - 12, font, TextAlign::MiddleCenter, kCondition);
    img.drawText(line2, cx, cy + 12, FontSize::Tiny, TextAlign::MiddleCenter, kMuted);
  } else {
    img.drawText(line1 ? line1 : "", cx, cy, font, TextAlign::MiddleCenter, kCondition);
  }
  return img;
}
