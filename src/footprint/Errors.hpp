#pragma once

#include <cstdint>

namespace footprint {

// Failure taxonomy shared by the pipeline stages.
//
// Stages report failures as `bool` + error string; this enum names the kind so callers
// (CLI, batch reports) can branch on it without parsing messages.
enum class PipelineError : std::uint8_t {
  None = 0,

  // Fewer than 3 nodes/edges (or cleaned segments) remain. Fatal for the call.
  InsufficientGeometry,

  // Raster segmentation enclosed an implausible fraction of the image. No outline.
  ImplausibleSegmentation,

  // The drawing carried no structural entities at all.
  NoGeometry,

  // The image could not be read or decoded.
  DecodeFailed,

  // Malformed drawing document or configuration.
  InvalidInput,
};

const char* PipelineErrorName(PipelineError e);

} // namespace footprint
