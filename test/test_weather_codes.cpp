#include <gtest/gtest.h>

#include <math.h>

#include "weather_codes.h"

TEST(WeatherCodes, KnownCodes) {
  EXPECT_STREQ(conditionText(0), "Clear");
  EXPECT_STREQ(conditionText(3), "Overcast");
  EXPECT_STREQ(conditionText(63), "Rain");
  EXPECT_STREQ(conditionText(95), "Thunderstorm");

  EXPECT_EQ(iconForCode(0), WeatherIcon::Clear);
  EXPECT_EQ(iconForCode(2), WeatherIcon::PartlyCloudy);
  EXPECT_EQ(iconForCode(45), WeatherIcon::Fog);
  EXPECT_EQ(iconForCode(53), WeatherIcon::Drizzle);
  EXPECT_EQ(iconForCode(80), WeatherIcon::Rain);
  EXPECT_EQ(iconForCode(86), WeatherIcon::Snow);
  EXPECT_EQ(iconForCode(99), WeatherIcon::Thunder);
}

TEST(WeatherCodes, UnknownCodes) {
  EXPECT_STREQ(conditionText(-1), "Unknown");
  EXPECT_STREQ(conditionText(4), "Unknown");
  EXPECT_EQ(iconForCode(100), WeatherIcon::Unknown);
}

TEST(WeatherCodes, WindCompass) {
  EXPECT_STREQ(windCompass(0), "N");
  EXPECT_STREQ(windCompass(22), "N");
  EXPECT_STREQ(windCompass(23), "NE");
  EXPECT_STREQ(windCompass(90), "E");
  EXPECT_STREQ(windCompass(225), "SW");
  EXPECT_STREQ(windCompass(350), "N");
  EXPECT_STREQ(windCompass(360), "N");
  EXPECT_STREQ(windCompass(NAN), "");
}

TEST(WeatherCodes, ColourBands) {
  EXPECT_EQ(temperatureColor(-3), temperatureColor(4.9f));
  EXPECT_NE(temperatureColor(4.9f), temperatureColor(5));
  EXPECT_NE(temperatureColor(27), temperatureColor(28));
  EXPECT_EQ(uvColor(0), uvColor(2));
  EXPECT_NE(uvColor(2), uvColor(3));
  EXPECT_NE(uvColor(10), uvColor(11));
}

TEST(WeatherCodes, Rgb565Packing) {
  EXPECT_EQ(rgb565(0, 0, 0), 0x0000);
  EXPECT_EQ(rgb565(255, 255, 255), 0xFFFF);
  EXPECT_EQ(rgb565(255, 0, 0), 0xF800);
  EXPECT_EQ(rgb565(0, 255, 0), 0x07E0);
  EXPECT_EQ(rgb565(0, 0, 255), 0x001F);
}
