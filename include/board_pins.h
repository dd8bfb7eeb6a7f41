#pragma once

#include <stdint.h>

// Shared SPI bus for the three panels.
static constexpr int8_t PANEL_PIN_SCLK = 18;
static constexpr int8_t PANEL_PIN_MOSI = 23;

// Main panel: ST7789 240x240.
static constexpr int8_t MAIN_PIN_CS = 5;
static constexpr int8_t MAIN_PIN_DC = 22;
static constexpr int8_t MAIN_PIN_RST = 27;
static constexpr int8_t MAIN_PIN_BL = 19;

// Left panel: ST7735S 160x80.
static constexpr int8_t LEFT_PIN_CS = 15;
static constexpr int8_t LEFT_PIN_DC = 4;
static constexpr int8_t LEFT_PIN_RST = 26;
static constexpr int8_t LEFT_PIN_BL = 13;

// Right panel: ST7735S 160x80.
static constexpr int8_t RIGHT_PIN_CS = 14;
static constexpr int8_t RIGHT_PIN_DC = 21;
static constexpr int8_t RIGHT_PIN_RST = 25;
static constexpr int8_t RIGHT_PIN_BL = 12;

// PWM channels for the three backlights.
static constexpr uint8_t MAIN_BL_CHANNEL = 5;
static constexpr uint8_t LEFT_BL_CHANNEL = 6;
static constexpr uint8_t RIGHT_BL_CHANNEL = 7;

// BOOT button, active LOW; a press requests the station to stop.
static constexpr uint8_t STOP_BUTTON_PIN = 0;
