#include "footprint/BoundaryGraph.hpp"

#include "footprint/Geometry.hpp"
#include "footprint/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <set>
#include <sstream>

namespace footprint {

namespace {

constexpr double kTwoPi = 2.0 * 3.14159265358979323846;

// One flag per traversal direction of each edge.
class DirectedEdgeSet {
public:
  explicit DirectedEdgeSet(const PlanarGraph& g) : m_graph(g), m_used(g.edges.size() * 2, 0) {}

  bool has(int edgeId, int from) const { return m_used[slot(edgeId, from)] != 0; }
  void add(int edgeId, int from) { m_used[slot(edgeId, from)] = 1; }

private:
  std::size_t slot(int edgeId, int from) const
  {
    const GraphEdge& e = m_graph.edges[static_cast<std::size_t>(edgeId)];
    return static_cast<std::size_t>(edgeId) * 2 + (e.node1 == from ? 0u : 1u);
  }

  const PlanarGraph& m_graph;
  std::vector<char> m_used;
};

struct Step {
  int edgeId = 0;
  int from = 0;
};

// Node cycle up to rotation and direction.
std::vector<int> CanonicalCycle(const std::vector<int>& ids)
{
  auto rotateToMin = [](std::vector<int> v) {
    const auto it = std::min_element(v.begin(), v.end());
    std::rotate(v.begin(), it, v.end());
    return v;
  };

  std::vector<int> fwd = rotateToMin(ids);
  std::vector<int> rev(ids.rbegin(), ids.rend());
  rev = rotateToMin(rev);
  return std::min(fwd, rev);
}

BoundaryLoop MakeLoop(const PlanarGraph& g, std::vector<int> ids)
{
  BoundaryLoop loop;
  loop.points.reserve(ids.size());
  for (int id : ids) loop.points.push_back(g.nodes[static_cast<std::size_t>(id)].pos);
  loop.nodeIds = std::move(ids);
  loop.signedArea = SignedPolygonArea(loop.points);
  loop.area = std::fabs(loop.signedArea);
  loop.perimeter = PolygonPerimeter(loop.points);
  return loop;
}

// Walk one face starting with the directed edge start -> firstNext. On success the walked
// directed edges are marked used and the closed node sequence is returned.
bool TraceFace(const PlanarGraph& g, int start, int firstNext, int firstEdge, DirectedEdgeSet& used,
               const DetectorConfig& cfg, std::vector<int>& outIds)
{
  const int maxSteps = static_cast<int>(g.nodes.size()) + cfg.walkStepSlack;

  std::vector<int> ids{start};
  std::vector<Step> steps{Step{firstEdge, start}};

  int prev = start;
  int cur = firstNext;

  for (int step = 0; step < maxSteps; ++step) {
    if (cur == start) {
      BoundaryLoop probe = MakeLoop(g, ids);
      if (!(probe.area > cfg.minLoopArea)) return false;

      for (const Step& s : steps) used.add(s.edgeId, s.from);
      outIds = std::move(ids);
      return true;
    }
    ids.push_back(cur);

    const GraphNode& node = g.nodes[static_cast<std::size_t>(cur)];
    const Vec2& p = node.pos;
    const Vec2& back = g.nodes[static_cast<std::size_t>(prev)].pos;
    const double inAngle = std::atan2(back.y - p.y, back.x - p.x);

    int bestEdge = -1;
    int bestNext = -1;
    double bestRel = 0.0;

    for (int eid : node.edges) {
      const GraphEdge& e = g.edges[static_cast<std::size_t>(eid)];
      const int next = g.otherEnd(e, cur);
      if (next == prev && node.edges.size() > 1) continue;

      const Vec2& q = g.nodes[static_cast<std::size_t>(next)].pos;
      double rel = std::atan2(q.y - p.y, q.x - p.x) - inAngle;
      if (rel <= 0.0) rel += kTwoPi;
      if (rel >= kTwoPi) rel -= kTwoPi;

      // Strict comparison keeps the first of equal candidates.
      if (bestEdge < 0 || rel < bestRel) {
        bestEdge = eid;
        bestNext = next;
        bestRel = rel;
      }
    }

    if (bestEdge < 0) return false;
    if (used.has(bestEdge, cur)) return false;

    steps.push_back(Step{bestEdge, cur});
    prev = cur;
    cur = bestNext;
  }

  return false;
}

} // namespace

PlanarGraph BuildPlanarGraph(const std::vector<Segment>& segs, double snapTolerance)
{
  PlanarGraph g;

  auto findOrCreate = [&](const Vec2& p) -> int {
    for (const GraphNode& n : g.nodes) {
      if (Distance(n.pos, p) <= snapTolerance) return n.id;
    }
    GraphNode n;
    n.id = static_cast<int>(g.nodes.size());
    n.pos = p;
    g.nodes.push_back(n);
    return n.id;
  };

  for (const Segment& s : segs) {
    const int n1 = findOrCreate(s.start);
    const int n2 = findOrCreate(s.end);
    if (n1 == n2) continue;

    const bool duplicate = std::any_of(g.edges.begin(), g.edges.end(), [&](const GraphEdge& e) {
      return (e.node1 == n1 && e.node2 == n2) || (e.node1 == n2 && e.node2 == n1);
    });
    if (duplicate) continue;

    GraphEdge e;
    e.id = static_cast<int>(g.edges.size());
    e.node1 = n1;
    e.node2 = n2;
    e.length = s.length;
    const Vec2& a = g.nodes[static_cast<std::size_t>(n1)].pos;
    const Vec2& b = g.nodes[static_cast<std::size_t>(n2)].pos;
    e.angle = std::atan2(b.y - a.y, b.x - a.x);

    g.edges.push_back(e);
    g.nodes[static_cast<std::size_t>(n1)].edges.push_back(e.id);
    g.nodes[static_cast<std::size_t>(n2)].edges.push_back(e.id);
  }

  return g;
}

std::vector<BoundaryLoop> EnumerateFaces(const PlanarGraph& g, const DetectorConfig& cfg)
{
  std::vector<BoundaryLoop> loops;
  DirectedEdgeSet used(g);
  std::set<std::vector<int>> seen;
  int duplicates = 0;

  for (const GraphEdge& e : g.edges) {
    const int dirs[2][2] = {{e.node1, e.node2}, {e.node2, e.node1}};
    for (const auto& d : dirs) {
      if (used.has(e.id, d[0])) continue;

      std::vector<int> ids;
      if (!TraceFace(g, d[0], d[1], e.id, used, cfg, ids)) continue;
      if (ids.size() < 3) continue;

      if (cfg.dedupeLoops && !seen.insert(CanonicalCycle(ids)).second) {
        ++duplicates;
        continue;
      }
      loops.push_back(MakeLoop(g, std::move(ids)));
    }
  }

  if (duplicates > 0) Logf(LogLevel::Debug, "boundary", "%d faces repeated an existing cycle", duplicates);
  return loops;
}

bool DetectOuterBoundary(const std::vector<Segment>& segs, double snapTolerance, BoundaryResult& out,
                         std::string& outError, const DetectorConfig& cfg)
{
  out = BoundaryResult{};
  out.graph = BuildPlanarGraph(segs, snapTolerance);
  const PlanarGraph& g = out.graph;

  Logf(LogLevel::Info, "boundary", "graph: %zu nodes, %zu edges", g.nodes.size(), g.edges.size());

  if (g.nodes.size() < 3 || g.edges.size() < 3) {
    std::ostringstream oss;
    oss << "Insufficient geometry to detect boundary (need at least 3 nodes and 3 edges, got " << g.nodes.size()
        << " nodes and " << g.edges.size() << " edges)";
    outError = oss.str();
    return false;
  }

  std::vector<BoundaryLoop> loops = EnumerateFaces(g, cfg);
  Logf(LogLevel::Info, "boundary", "found %zu closed loops", loops.size());

  if (loops.empty()) {
    Logf(LogLevel::Warn, "boundary", "no closed loops found, using convex hull as fallback");

    std::vector<Vec2> pts;
    pts.reserve(g.nodes.size());
    for (const GraphNode& n : g.nodes) pts.push_back(n.pos);

    std::vector<int> ids = ConvexHullIndices(pts);
    BoundaryLoop hull = MakeLoop(g, std::move(ids));
    if (hull.points.size() < 3 || !(hull.area > cfg.minLoopArea)) {
      std::ostringstream oss;
      oss << "Insufficient geometry to detect boundary (convex hull of " << g.nodes.size()
          << " nodes has no area)";
      outError = oss.str();
      out.outerBoundary = BoundaryLoop{};
      return false;
    }
    out.outerBoundary = std::move(hull);
    out.usedHullFallback = true;
    return true;
  }

  std::stable_sort(loops.begin(), loops.end(),
                   [](const BoundaryLoop& a, const BoundaryLoop& b) { return a.area > b.area; });

  out.outerBoundary = std::move(loops.front());
  out.innerLoops.assign(std::make_move_iterator(loops.begin() + 1), std::make_move_iterator(loops.end()));

  Logf(LogLevel::Info, "boundary", "outer boundary: %zu points, area=%.1f, perimeter=%.1f",
       out.outerBoundary.points.size(), out.outerBoundary.area, out.outerBoundary.perimeter);
  return true;
}

} // namespace footprint
