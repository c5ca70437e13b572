#include "footprint/Errors.hpp"

namespace footprint {

const char* PipelineErrorName(PipelineError e)
{
  switch (e) {
  case PipelineError::None: return "none";
  case PipelineError::InsufficientGeometry: return "insufficient_geometry";
  case PipelineError::ImplausibleSegmentation: return "implausible_segmentation";
  case PipelineError::NoGeometry: return "no_geometry";
  case PipelineError::DecodeFailed: return "decode_failed";
  case PipelineError::InvalidInput: return "invalid_input";
  default: return "unknown";
  }
}

} // namespace footprint
