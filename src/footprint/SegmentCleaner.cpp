#include "footprint/SegmentCleaner.hpp"

#include "footprint/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <utility>

namespace footprint {

namespace {

constexpr double kPi = 3.14159265358979323846;

bool EndpointsTouch(const Segment& a, const Segment& b, double tol)
{
  return Distance(a.start, b.start) <= tol || Distance(a.start, b.end) <= tol || Distance(a.end, b.start) <= tol ||
         Distance(a.end, b.end) <= tol;
}

// Returns true and fills `out` when `a` and `b` share an endpoint and are collinear.
bool TryMerge(const Segment& a, const Segment& b, double distTol, double angleTol, Segment& out)
{
  const Vec2* joints[4][2] = {
      {&a.end, &b.start},
      {&a.end, &b.end},
      {&a.start, &b.start},
      {&a.start, &b.end},
  };

  bool adjacent = false;
  for (const auto& j : joints) {
    if (Distance(*j[0], *j[1]) <= distTol) {
      adjacent = true;
      break;
    }
  }
  if (!adjacent) return false;

  const double angleA = std::atan2(a.end.y - a.start.y, a.end.x - a.start.x);
  const double angleB = std::atan2(b.end.y - b.start.y, b.end.x - b.start.x);
  double diff = std::fabs(angleA - angleB);
  if (diff > kPi) diff = 2.0 * kPi - diff;
  if (diff > angleTol && std::fabs(diff - kPi) > angleTol) return false;

  // Span the two farthest of the four endpoints.
  const Vec2 pts[4] = {a.start, a.end, b.start, b.end};
  double best = 0.0;
  int bi = 0;
  int bj = 1;
  for (int i = 0; i < 4; ++i) {
    for (int j = i + 1; j < 4; ++j) {
      const double d = Distance(pts[i], pts[j]);
      if (d > best) {
        best = d;
        bi = i;
        bj = j;
      }
    }
  }

  out.start = pts[bi];
  out.end = pts[bj];
  out.length = best;
  return true;
}

} // namespace

CleaningTolerances ComputeAdaptiveTolerances(const Bounds2D& bounds, DrawingUnit unit, const CleanerConfig& cfg)
{
  const double maxDim = bounds.maxExtent();
  const double toUnit = 1.0 / UnitToMm(unit);

  CleaningTolerances t;
  t.snap = std::max(cfg.snapFloorMm * toUnit, maxDim * cfg.snapFactor);
  t.minLength = std::max(cfg.minLengthFloorMm * toUnit, maxDim * cfg.minLengthFactor);

  Logf(LogLevel::Info, "cleaner", "tolerances: snap=%.3f minLen=%.3f (extent %.1f %s)", t.snap, t.minLength, maxDim,
       DrawingUnitName(unit));
  return t;
}

std::vector<Segment> SnapEndpoints(const std::vector<Segment>& segs, double tolerance, double zeroLength)
{
  const std::size_t n = segs.size() * 2;
  std::vector<Vec2> pts;
  pts.reserve(n);
  for (const Segment& s : segs) {
    pts.push_back(s.start);
    pts.push_back(s.end);
  }

  struct Cluster {
    double sx = 0.0;
    double sy = 0.0;
    std::vector<std::size_t> members;

    Vec2 centroid() const
    {
      const double k = static_cast<double>(members.size());
      return Vec2{sx / k, sy / k};
    }
  };

  std::vector<Cluster> clusters;
  std::vector<char> assigned(n, 0);

  for (std::size_t i = 0; i < n; ++i) {
    if (assigned[i]) continue;
    assigned[i] = 1;
    Cluster c;
    c.members.push_back(i);

    // Membership is tested against the seed only, not the growing centroid.
    for (std::size_t j = i + 1; j < n; ++j) {
      if (assigned[j]) continue;
      if (Distance(pts[j], pts[i]) <= tolerance) {
        c.members.push_back(j);
        assigned[j] = 1;
      }
    }
    for (std::size_t k : c.members) {
      c.sx += pts[k].x;
      c.sy += pts[k].y;
    }
    clusters.push_back(std::move(c));
  }

  // Fold together clusters whose centroids ended up within tolerance, so that
  // snapped output is left unchanged by another pass. Each fold removes a cluster.
  bool folded = true;
  while (folded) {
    folded = false;
    for (std::size_t a = 0; a < clusters.size() && !folded; ++a) {
      for (std::size_t b = a + 1; b < clusters.size(); ++b) {
        if (Distance(clusters[a].centroid(), clusters[b].centroid()) > tolerance) continue;
        clusters[a].sx += clusters[b].sx;
        clusters[a].sy += clusters[b].sy;
        clusters[a].members.insert(clusters[a].members.end(), clusters[b].members.begin(), clusters[b].members.end());
        clusters.erase(clusters.begin() + static_cast<std::ptrdiff_t>(b));
        folded = true;
        break;
      }
    }
  }

  std::vector<Vec2> snapped(n);
  for (const Cluster& c : clusters) {
    const Vec2 p = c.centroid();
    for (std::size_t k : c.members) snapped[k] = p;
  }

  std::vector<Segment> out;
  out.reserve(segs.size());
  for (std::size_t i = 0; i < segs.size(); ++i) {
    const Segment s = MakeSegment(snapped[i * 2], snapped[i * 2 + 1]);
    if (s.length > zeroLength) out.push_back(s);
  }
  return out;
}

std::vector<Segment> MergeCollinearSegments(const std::vector<Segment>& segs, double tolerance, double angleTolDeg)
{
  const double angleTol = angleTolDeg * kPi / 180.0;
  std::vector<Segment> cur = segs;

  // Every productive pass removes at least one segment.
  const std::size_t maxPasses = segs.size() + 1;
  bool changed = true;
  std::size_t pass = 0;

  while (changed && pass < maxPasses) {
    changed = false;
    ++pass;

    std::vector<Segment> next;
    std::vector<char> used(cur.size(), 0);

    for (std::size_t i = 0; i < cur.size(); ++i) {
      if (used[i]) continue;
      used[i] = 1;
      Segment seg = cur[i];

      bool extended = true;
      while (extended) {
        extended = false;
        for (std::size_t j = 0; j < cur.size(); ++j) {
          if (used[j]) continue;
          Segment merged;
          if (TryMerge(seg, cur[j], tolerance, angleTol, merged)) {
            seg = merged;
            used[j] = 1;
            extended = true;
            changed = true;
          }
        }
      }
      next.push_back(seg);
    }

    cur.swap(next);
  }

  if (changed) Logf(LogLevel::Warn, "cleaner", "collinear merge stopped at pass cap (%zu)", maxPasses);
  return cur;
}

std::vector<Segment> RemoveDuplicateSegments(const std::vector<Segment>& segs, double tolerance)
{
  std::vector<Segment> out;
  out.reserve(segs.size());

  for (const Segment& a : segs) {
    bool dup = false;
    for (const Segment& b : out) {
      const double d1 = Distance(a.start, b.start) + Distance(a.end, b.end);
      const double d2 = Distance(a.start, b.end) + Distance(a.end, b.start);
      if (std::min(d1, d2) < tolerance * 2.0) {
        dup = true;
        break;
      }
    }
    if (!dup) out.push_back(a);
  }
  return out;
}

std::vector<Segment> RemoveDisconnectedSegments(const std::vector<Segment>& segs, double tolerance)
{
  const std::size_t n = segs.size();
  if (n <= 1) return segs;

  std::vector<std::vector<std::size_t>> adj(n);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      if (EndpointsTouch(segs[i], segs[j], tolerance)) {
        adj[i].push_back(j);
        adj[j].push_back(i);
      }
    }
  }

  std::vector<int> comp(n, -1);
  std::vector<std::size_t> compSize;
  std::deque<std::size_t> queue;

  for (std::size_t i = 0; i < n; ++i) {
    if (comp[i] >= 0) continue;
    const int id = static_cast<int>(compSize.size());
    compSize.push_back(0);

    comp[i] = id;
    queue.push_back(i);
    while (!queue.empty()) {
      const std::size_t u = queue.front();
      queue.pop_front();
      ++compSize.back();
      for (std::size_t v : adj[u]) {
        if (comp[v] >= 0) continue;
        comp[v] = id;
        queue.push_back(v);
      }
    }
  }

  if (compSize.size() <= 1) return segs;

  // Largest component; the first one discovered wins ties.
  int keep = 0;
  for (std::size_t c = 1; c < compSize.size(); ++c) {
    if (compSize[c] > compSize[static_cast<std::size_t>(keep)]) keep = static_cast<int>(c);
  }

  Logf(LogLevel::Info, "cleaner", "%zu components, keeping %zu of %zu segments", compSize.size(),
       compSize[static_cast<std::size_t>(keep)], n);

  std::vector<Segment> out;
  out.reserve(compSize[static_cast<std::size_t>(keep)]);
  for (std::size_t i = 0; i < n; ++i) {
    if (comp[i] == keep) out.push_back(segs[i]);
  }
  return out;
}

CleaningResult CleanSegments(const std::vector<Segment>& raw, double minLength, double snapTolerance,
                             const CleanerConfig& cfg)
{
  CleaningResult r;
  Logf(LogLevel::Info, "cleaner", "cleaning %zu raw segments (minLen=%.3f, snap=%.3f)", raw.size(), minLength,
       snapTolerance);

  std::vector<Segment> segs;
  segs.reserve(raw.size());
  for (const Segment& s : raw) {
    const double len = Distance(s.start, s.end);
    if (len < minLength) {
      ++r.stats.tooShort;
      continue;
    }
    segs.push_back(MakeSegment(s.start, s.end));
  }

  segs = SnapEndpoints(segs, snapTolerance, cfg.zeroLength);
  Logf(LogLevel::Debug, "cleaner", "after snapping: %zu", segs.size());

  std::size_t before = segs.size();
  segs = MergeCollinearSegments(segs, snapTolerance, cfg.collinearAngleDeg);
  r.stats.merged = static_cast<int>(before - segs.size());

  before = segs.size();
  segs = RemoveDuplicateSegments(segs, snapTolerance);
  r.stats.duplicates = static_cast<int>(before - segs.size());

  before = segs.size();
  segs = RemoveDisconnectedSegments(segs, snapTolerance);
  r.stats.disconnected = static_cast<int>(before - segs.size());

  for (Segment& s : segs) s.length = Distance(s.start, s.end);

  Logf(LogLevel::Info, "cleaner", "%zu segments (short %d, merged %d, duplicates %d, disconnected %d)", segs.size(),
       r.stats.tooShort, r.stats.merged, r.stats.duplicates, r.stats.disconnected);

  r.segments = std::move(segs);
  return r;
}

} // namespace footprint
