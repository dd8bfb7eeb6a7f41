#ifndef SECRETS_H
#define SECRETS_H

// ==================== WIFI CONFIGURATION ====================
// Your WiFi network credentials
#define WIFI_SSID "YourWiFiSSID"
#define WIFI_PASSWORD "YourWiFiPassword"

// ==================== SETUP INSTRUCTIONS ====================
// 1. Copy this file to secrets.h: cp secrets_template.h secrets.h
// 2. Replace the placeholder values above with your actual credentials
// 3. Add secrets.h to your .gitignore file to keep credentials private
// 4. Build and upload the firmware
//
// Open-Meteo needs no API key. Location, label and backlight levels can be
// overridden per device in the "tripanel" NVS namespace (see README.md).

#endif // SECRETS_H
