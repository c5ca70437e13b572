#pragma once

#include "footprint/Config.hpp"
#include "footprint/Types.hpp"

#include <string>
#include <vector>

namespace footprint {

// Graph Boundary Detector.
//
// Builds a planar graph from cleaned segments, enumerates its faces by always taking
// the smallest positive turn, and selects the loop with the largest absolute area as
// the exterior boundary. Falls back to the convex hull of all nodes when no face
// closes.

struct GraphNode {
  int id = 0;
  Vec2 pos;

  // Incident edge ids, in insertion order.
  std::vector<int> edges;
};

struct GraphEdge {
  int id = 0;
  int node1 = 0;
  int node2 = 0;
  double length = 0.0;

  // Direction node1 -> node2, radians.
  double angle = 0.0;
};

struct PlanarGraph {
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;

  int otherEnd(const GraphEdge& e, int node) const { return e.node1 == node ? e.node2 : e.node1; }
};

// Closed polygon. The first point is not repeated at the end.
struct BoundaryLoop {
  std::vector<int> nodeIds;
  std::vector<Vec2> points;

  // Shoelace area (positive = counter-clockwise) and its absolute value.
  double signedArea = 0.0;
  double area = 0.0;
  double perimeter = 0.0;
};

struct BoundaryResult {
  BoundaryLoop outerBoundary;
  std::vector<BoundaryLoop> innerLoops;
  PlanarGraph graph;

  // True when no face closed and the convex hull of the nodes was used instead.
  bool usedHullFallback = false;
};

// Nodes are matched by linear scan within `snapTolerance`. Zero-length edges and repeated
// edges between the same node pair are skipped.
PlanarGraph BuildPlanarGraph(const std::vector<Segment>& segs, double snapTolerance);

// All accepted faces of `graph`, unsorted.
std::vector<BoundaryLoop> EnumerateFaces(const PlanarGraph& graph, const DetectorConfig& cfg = {});

// Returns false (InsufficientGeometry) when the graph has fewer than 3 nodes or edges.
bool DetectOuterBoundary(const std::vector<Segment>& segs, double snapTolerance, BoundaryResult& out,
                         std::string& outError, const DetectorConfig& cfg = {});

} // namespace footprint
