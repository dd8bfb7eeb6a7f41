#pragma once

#include "station_settings.h"

// Load settings from the NVS namespace, falling back to the compiled-in
// defaults for every key that is absent. Returns false when NVS could not be
// opened (defaults are still written to `out`).
bool loadStationSettings(StationSettings &out);

