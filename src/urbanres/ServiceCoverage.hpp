#pragma once

#include "urbanres/MapSynth.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/Vehicle.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace urbanres {

// Ambulance response-time coverage over a regular grid.
//
// Every cell center is routed from every ambulance station; the best complete path time
// decides the cell's service level. Running the analysis before and after applying a
// disaster's obstructions and comparing the two reports shows where the response
// network degraded.

enum class CoverageLevel : std::uint8_t {
  Excellent = 0,
  Good = 1,
  Fair = 2,
  Poor = 3,
  Unreachable = 4,
};

constexpr int kCoverageLevelCount = 5;

const char* ToString(CoverageLevel l);

struct CoverageConfig {
  double cellSize = 100.0; // meters

  double excellentSec = 300.0;
  double goodSec = 600.0;
  double fairSec = 900.0;
  double maxResponseSec = 1800.0; // slower than this counts as unreachable

  VehicleType vehicle = VehicleType::Ambulance;
};

bool ValidateCoverageConfig(const CoverageConfig& cfg, std::string& outError);

CoverageLevel ClassifyResponseTime(double seconds, const CoverageConfig& cfg);

struct CoverageCell {
  int col = 0;
  int row = 0;
  Vec2 center;
  double responseSec = std::numeric_limits<double>::infinity(); // inf when unreachable
  int station = -1; // index into the station list
  CoverageLevel level = CoverageLevel::Unreachable;
};

struct CoverageStats {
  int cells = 0;
  int reachable = 0;
  std::array<int, kCoverageLevelCount> byLevel{{0, 0, 0, 0, 0}};

  double coveragePct = 0.0;
  double avgResponseSec = 0.0;
  double medianResponseSec = 0.0;
  double maxResponseSec = 0.0;

  double blindAreaKm2 = 0.0;
  double totalAreaKm2 = 0.0;
};

struct CoverageReport {
  MapBounds bounds;
  double cellSize = 0.0;
  int cols = 0;
  int rows = 0;
  int stations = 0;
  std::vector<CoverageCell> cells; // row-major
  CoverageStats stats;
};

// Cell centers: (col + 0.5) * cellSize from the min corner, clamped half a cell inside
// the map.
std::vector<CoverageCell> BuildCoverageGrid(const MapBounds& bounds, double cellSize, int& outCols, int& outRows);

CoverageStats SummarizeCoverage(const std::vector<CoverageCell>& cells, double cellSize);

// Uses the analyzer's current obstruction state.
bool AnalyzeServiceCoverage(RoadNetworkAnalyzer& analyzer, const MapBounds& bounds, const std::vector<Vec2>& stations,
                            const CoverageConfig& cfg, CoverageReport& out, std::string& outError);

enum class CoverageChange : std::uint8_t {
  NewlyUnreachable = 0,
  NewlyReachable = 1,
  StillUnreachable = 2,
  SeverelyDegraded = 3,   // > 50% slower
  ModeratelyDegraded = 4, // > 20% slower
  SlightlyDegraded = 5,   // any slowdown
  Improved = 6,
  Unchanged = 7,
};

constexpr int kCoverageChangeCount = 8;

const char* ToString(CoverageChange c);

CoverageChange ClassifyCoverageChange(double beforeSec, double afterSec);

struct CoverageComparison {
  std::vector<CoverageChange> cells; // parallel to the report cells
  std::array<int, kCoverageChangeCount> counts{{0, 0, 0, 0, 0, 0, 0, 0}};

  double coverageChangePct = 0.0; // after - before
  int degradedCells = 0;
  double avgIncreaseSec = 0.0;    // over cells reachable in both
  double medianIncreaseSec = 0.0;
};

// Both reports must cover the same grid.
bool CompareCoverage(const CoverageReport& before, const CoverageReport& after, CoverageComparison& out,
                     std::string& outError);

} // namespace urbanres
