#pragma once

#include "footprint/Image.hpp"
#include "footprint/Types.hpp"

#include <cstdint>
#include <vector>

namespace footprint {

// Binary raster masks for the raster outline path.
//
// All operations allocate a fresh mask; inputs are never modified. Connectivity is
// 4-neighbour for regions and 8-neighbour for contour tracing.

struct BinaryMask {
  int width = 0;
  int height = 0;

  // 0 or 1 per pixel, row-major.
  std::vector<std::uint8_t> bits;

  BinaryMask() = default;
  BinaryMask(int w, int h) : width(w), height(h), bits(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), 0) {}

  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }

  bool get(int x, int y) const { return inBounds(x, y) && bits[index(x, y)] != 0; }
  void set(int x, int y, bool v) { bits[index(x, y)] = v ? 1 : 0; }

  std::size_t count() const;
};

// 1 where gray < threshold.
BinaryMask ThresholdBelow(const GrayImage& gray, int threshold);

// Square dilation with a (2r+1) box, done as a horizontal then a vertical running count.
BinaryMask DilateBox(const BinaryMask& mask, int radius);

// Pixels reachable from the image border through pixels that are 0 in `blockers`.
BinaryMask FloodFromBorder(const BinaryMask& blockers);

// 1 where `mask` is 0 and vice versa.
BinaryMask Invert(const BinaryMask& mask);

// Only the largest 4-connected component. Ties go to the component found first in
// row-major order. An empty mask is returned unchanged.
BinaryMask KeepLargestComponent(const BinaryMask& mask);

// Background regions not connected to the border become foreground.
BinaryMask FillHoles(const BinaryMask& mask);

// Moore-neighbour tracing of the outer boundary of the foreground, starting at the
// topmost-leftmost foreground pixel and searching clockwise. The start pixel is not
// repeated at the end. Stops after 2 * width * height steps.
std::vector<Vec2> TraceMooreContour(const BinaryMask& mask);

} // namespace footprint
