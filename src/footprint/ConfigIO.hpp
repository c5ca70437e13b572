#pragma once

#include "footprint/Config.hpp"
#include "footprint/Json.hpp"

#include <string>

namespace footprint {

// JSON helpers for FootprintConfig.
//
// Layout:
//   {
//     "cleaner":  {"snap_factor": 0.001, ...},
//     "detector": {"min_loop_area": 0.1, ...},
//     "raster":   {"threshold": 160, ...},
//     "height":   {"min_plausible_mm": 2500, ...}
//   }
//
// Overrides use merge semantics: missing keys (or whole sections) leave the existing
// config unchanged. Field names are snake_case.

std::string FootprintConfigToJson(const FootprintConfig& cfg, int indentSpaces = 2);

// Apply JSON overrides into an existing config, then validate the result.
bool ApplyFootprintConfigJson(const JsonValue& root, FootprintConfig& ioCfg, std::string& outError);

// Range checks (positive tolerances, threshold in 1..255, ordered fractions...).
bool ValidateFootprintConfig(const FootprintConfig& cfg, std::string& outError);

bool WriteFootprintConfigJsonFile(const std::string& path, const FootprintConfig& cfg, std::string& outError,
                                  int indentSpaces = 2);

bool LoadFootprintConfigJsonFile(const std::string& path, FootprintConfig& ioCfg, std::string& outError);

} // namespace footprint
