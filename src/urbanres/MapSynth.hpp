#pragma once

#include "urbanres/Random.hpp"
#include "urbanres/RoadGraph.hpp"
#include "urbanres/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// Procedural road map synthesis.
//
// Roads are first laid out as independent straight segments (main arteries, diagonal
// arteries, block alleys) and then stitched into a RoadGraph by resolving every pairwise
// crossing into a shared node.

struct MapBounds {
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 2000.0;
  double maxY = 2000.0;

  double width() const { return maxX - minX; }
  double height() const { return maxY - minY; }
  bool contains(Vec2 p) const { return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY; }
};

struct MapSynthConfig {
  double width = 2000.0;  // meters
  double height = 2000.0; // meters

  // Straight arteries; half run vertically, the rest horizontally.
  int mainRoadCount = 4;
  double mainRoadWidth = 12.0;
  int mainRoadLanes = 4;
  double mainRoadSpeedKmh = 70.0;
  double mainRoadInset = 50.0; // straight arteries stop this far from the map edge

  // Diagonal arteries.
  int diagonalMin = 1;
  int diagonalMax = 2;
  double diagonalJitterDeg = 10.0;
  double diagonalOvershoot = 1.2;

  double secondaryRoadWidth = 6.0;
  int secondaryRoadLanes = 2;
  double secondaryRoadSpeedKmh = 30.0;

  // Alleys inside each block bounded by adjacent straight arteries.
  int alleysPerBlockMin = 1;
  int alleysPerBlockMax = 4;
  double fullLengthAlleyChance = 0.5;
  double horizontalAlleyChance = 0.5;
  double alleyBidirectionalChance = 0.7;
  double alleyTiltChance = 0.3; // partial alleys only
  double alleyMaxTiltDeg = 20.0;
  double alleyBlockMargin = 10.0; // tilted alleys stay this far inside the block
  double alleyPositionMin = 0.2;
  double alleyPositionMax = 0.8;
  double partialAlleyMinFrac = 0.3;
  double partialAlleyMaxFrac = 0.8;

  double minRoadLength = 5.0;
};

enum class RoadSegmentOrigin : std::uint8_t {
  MainStraight = 0,
  MainDiagonal = 1,
  Alley = 2,
};

// Unresolved road: one straight segment with its road attributes.
struct RoadSegment {
  Vec2 a;
  Vec2 b;
  RoadSpec spec;
  RoadSegmentOrigin origin = RoadSegmentOrigin::Alley;
};

struct IntersectionStats {
  int segmentsIn = 0;
  int segmentsSkipped = 0; // zero-length or duplicate
  int crossings = 0;       // pairwise point intersections found
  int splitNodes = 0;      // nodes created at crossings that were not endpoints
};

struct SynthesizedMap {
  MapBounds bounds;
  RoadGraph graph;

  int mainRoads = 0;
  int diagonalRoads = 0;
  int alleys = 0;
  IntersectionStats intersections;
};

bool ValidateMapSynthConfig(const MapSynthConfig& cfg, std::string& outError);

MapBounds BoundsOf(const MapSynthConfig& cfg);

RoadSpec MainRoadSpec(const MapSynthConfig& cfg);
RoadSpec SecondaryRoadSpec(const MapSynthConfig& cfg, bool bidirectional);

// Full-span straight arteries (deterministic, no randomness).
std::vector<RoadSegment> GenerateMainRoadSegments(const MapSynthConfig& cfg);

// Alleys for every block bounded by adjacent straight arteries in `mains`.
std::vector<RoadSegment> GenerateAlleySegments(const MapSynthConfig& cfg, const std::vector<RoadSegment>& mains,
                                               RNG& rng);

// 1-2 arteries at a randomized angle crossing the whole map, clipped to the map rectangle.
std::vector<RoadSegment> GenerateDiagonalRoadSegments(const MapSynthConfig& cfg, RNG& rng);

// Resolve all pairwise crossings and build the graph.
RoadGraph BuildRoadGraphFromSegments(const std::vector<RoadSegment>& segments, IntersectionStats* outStats = nullptr);

// Run the whole pipeline: main roads, alleys, diagonals, then intersection resolution.
bool SynthesizeRoadMap(const MapSynthConfig& cfg, std::uint64_t seed, SynthesizedMap& out, std::string& outError);

} // namespace urbanres
