#include "footprint/Mask.hpp"

#include <algorithm>
#include <cstddef>

namespace footprint {

namespace {

constexpr int kDx4[4] = {1, -1, 0, 0};
constexpr int kDy4[4] = {0, 0, 1, -1};

// Clockwise starting east, in image coordinates (+y down): E SE S SW W NW N NE.
constexpr int kDx8[8] = {1, 1, 0, -1, -1, -1, 0, 1};
constexpr int kDy8[8] = {0, 1, 1, 1, 0, -1, -1, -1};

// BFS over 4-neighbours where `passable(i)` holds, from the given seeds. Marks `visited`.
template <typename Passable>
void Flood(const BinaryMask& shape, std::vector<std::size_t>& queue, std::vector<std::uint8_t>& visited,
           Passable passable)
{
  std::size_t head = 0;
  const int w = shape.width;
  while (head < queue.size()) {
    const std::size_t idx = queue[head++];
    const int cx = static_cast<int>(idx % static_cast<std::size_t>(w));
    const int cy = static_cast<int>(idx / static_cast<std::size_t>(w));
    for (int d = 0; d < 4; ++d) {
      const int nx = cx + kDx4[d];
      const int ny = cy + kDy4[d];
      if (!shape.inBounds(nx, ny)) continue;
      const std::size_t ni = shape.index(nx, ny);
      if (visited[ni] || !passable(ni)) continue;
      visited[ni] = 1;
      queue.push_back(ni);
    }
  }
}

} // namespace

std::size_t BinaryMask::count() const
{
  return static_cast<std::size_t>(std::count(bits.begin(), bits.end(), std::uint8_t{1}));
}

BinaryMask ThresholdBelow(const GrayImage& gray, int threshold)
{
  BinaryMask m(gray.width, gray.height);
  for (std::size_t i = 0; i < m.bits.size() && i < gray.pixels.size(); ++i) {
    m.bits[i] = (static_cast<int>(gray.pixels[i]) < threshold) ? 1 : 0;
  }
  return m;
}

BinaryMask DilateBox(const BinaryMask& mask, int radius)
{
  const int w = mask.width;
  const int h = mask.height;
  if (radius <= 0 || w <= 0 || h <= 0) return mask;

  // Horizontal pass: window [x - r, x + r].
  BinaryMask horiz(w, h);
  for (int y = 0; y < h; ++y) {
    int count = 0;
    for (int x = 0; x <= radius && x < w; ++x) count += mask.bits[mask.index(x, y)];
    horiz.bits[horiz.index(0, y)] = count > 0 ? 1 : 0;
    for (int x = 1; x < w; ++x) {
      const int add = x + radius;
      const int rem = x - radius - 1;
      if (add < w) count += mask.bits[mask.index(add, y)];
      if (rem >= 0) count -= mask.bits[mask.index(rem, y)];
      horiz.bits[horiz.index(x, y)] = count > 0 ? 1 : 0;
    }
  }

  BinaryMask out(w, h);
  for (int x = 0; x < w; ++x) {
    int count = 0;
    for (int y = 0; y <= radius && y < h; ++y) count += horiz.bits[horiz.index(x, y)];
    out.bits[out.index(x, 0)] = count > 0 ? 1 : 0;
    for (int y = 1; y < h; ++y) {
      const int add = y + radius;
      const int rem = y - radius - 1;
      if (add < h) count += horiz.bits[horiz.index(x, add)];
      if (rem >= 0) count -= horiz.bits[horiz.index(x, rem)];
      out.bits[out.index(x, y)] = count > 0 ? 1 : 0;
    }
  }
  return out;
}

BinaryMask FloodFromBorder(const BinaryMask& blockers)
{
  const int w = blockers.width;
  const int h = blockers.height;
  BinaryMask reached(w, h);
  if (w <= 0 || h <= 0) return reached;

  std::vector<std::size_t> queue;
  auto seed = [&](int x, int y) {
    const std::size_t i = blockers.index(x, y);
    if (blockers.bits[i] || reached.bits[i]) return;
    reached.bits[i] = 1;
    queue.push_back(i);
  };

  for (int x = 0; x < w; ++x) {
    seed(x, 0);
    seed(x, h - 1);
  }
  for (int y = 0; y < h; ++y) {
    seed(0, y);
    seed(w - 1, y);
  }

  Flood(blockers, queue, reached.bits, [&](std::size_t i) { return blockers.bits[i] == 0; });
  return reached;
}

BinaryMask Invert(const BinaryMask& mask)
{
  BinaryMask out(mask.width, mask.height);
  for (std::size_t i = 0; i < mask.bits.size(); ++i) out.bits[i] = mask.bits[i] ? 0 : 1;
  return out;
}

BinaryMask KeepLargestComponent(const BinaryMask& mask)
{
  const int w = mask.width;
  const int h = mask.height;

  std::vector<std::uint8_t> visited(mask.bits.size(), 0);
  std::vector<std::size_t> queue;
  std::vector<std::size_t> best;

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t i = mask.index(x, y);
      if (!mask.bits[i] || visited[i]) continue;

      queue.clear();
      queue.push_back(i);
      visited[i] = 1;
      Flood(mask, queue, visited, [&](std::size_t j) { return mask.bits[j] != 0; });

      // The queue now holds exactly the component's pixels.
      if (queue.size() > best.size()) best.swap(queue);
    }
  }

  if (best.empty()) return mask;

  BinaryMask out(w, h);
  for (std::size_t i : best) out.bits[i] = 1;
  return out;
}

BinaryMask FillHoles(const BinaryMask& mask)
{
  const BinaryMask outside = FloodFromBorder(mask);
  BinaryMask out = mask;
  for (std::size_t i = 0; i < out.bits.size(); ++i) {
    if (!mask.bits[i] && !outside.bits[i]) out.bits[i] = 1;
  }
  return out;
}

std::vector<Vec2> TraceMooreContour(const BinaryMask& mask)
{
  std::vector<Vec2> contour;

  int sx = -1;
  int sy = -1;
  for (int y = 0; y < mask.height && sx < 0; ++y) {
    for (int x = 0; x < mask.width; ++x) {
      if (mask.bits[mask.index(x, y)]) {
        sx = x;
        sy = y;
        break;
      }
    }
  }
  if (sx < 0) return contour;

  int cx = sx;
  int cy = sy;

  // Topmost-leftmost: the west neighbour of the start is background.
  int backDir = 4;

  const long long maxIter = 2LL * mask.width * mask.height;
  for (long long iter = 0; iter < maxIter; ++iter) {
    contour.push_back(Vec2{static_cast<double>(cx), static_cast<double>(cy)});

    bool found = false;
    for (int i = 0; i < 8; ++i) {
      const int d = (backDir + 1 + i) % 8;
      const int nx = cx + kDx8[d];
      const int ny = cy + kDy8[d];
      if (mask.get(nx, ny)) {
        cx = nx;
        cy = ny;
        backDir = (d + 4) % 8;
        found = true;
        break;
      }
    }
    if (!found) break;
    if (cx == sx && cy == sy) break;
  }

  return contour;
}

} // namespace footprint
