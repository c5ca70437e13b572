#pragma once

#include "footprint/Json.hpp"
#include "footprint/Pipeline.hpp"

#include <iosfwd>
#include <string>

namespace footprint {

// JSON reports for pipeline results.
//
// The extraction object follows the downstream contract:
//   {"wallSegments":[...], "perimeterTotal":..., "buildingHeight":null|mm,
//    "heightNote":"...", "unit":"mm", "allGeometry":[...]}
// wrapped with success/error fields and the run diagnostics.

struct ResultJsonOptions {
  bool pretty = true;

  // Include the cleaned geometry (can be large).
  bool includeGeometry = true;
};

bool WriteExtractionJson(JsonWriter& w, const ExtractionResult& r, bool includeGeometry);

bool WriteVectorResultJson(std::ostream& os, const VectorResult& r, const ResultJsonOptions& opt,
                           std::string& outError);

bool WriteRasterResultJson(std::ostream& os, const RasterResult& r, const ResultJsonOptions& opt,
                           std::string& outError);

// Convenience: write to a file ("-" is not special).
bool WriteVectorResultJsonFile(const std::string& path, const VectorResult& r, const ResultJsonOptions& opt,
                               std::string& outError);
bool WriteRasterResultJsonFile(const std::string& path, const RasterResult& r, const ResultJsonOptions& opt,
                               std::string& outError);

} // namespace footprint
