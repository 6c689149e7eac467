#include "urbanres/ServiceCoverage.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>

namespace urbanres {

namespace {

// Upper median (element n/2 of the sorted values), 0 for an empty set.
double MedianOf(std::vector<double> values)
{
  if (values.empty()) return 0.0;
  const std::size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
  return values[mid];
}

double MeanOf(const std::vector<double>& values)
{
  if (values.empty()) return 0.0;
  double sum = 0.0;
  for (const double v : values) sum += v;
  return sum / static_cast<double>(values.size());
}

} // namespace

const char* ToString(CoverageLevel l)
{
  switch (l) {
  case CoverageLevel::Excellent: return "excellent";
  case CoverageLevel::Good: return "good";
  case CoverageLevel::Fair: return "fair";
  case CoverageLevel::Poor: return "poor";
  case CoverageLevel::Unreachable: return "unreachable";
  }
  return "unreachable";
}

const char* ToString(CoverageChange c)
{
  switch (c) {
  case CoverageChange::NewlyUnreachable: return "newly_unreachable";
  case CoverageChange::NewlyReachable: return "newly_reachable";
  case CoverageChange::StillUnreachable: return "still_unreachable";
  case CoverageChange::SeverelyDegraded: return "severely_degraded";
  case CoverageChange::ModeratelyDegraded: return "moderately_degraded";
  case CoverageChange::SlightlyDegraded: return "slightly_degraded";
  case CoverageChange::Improved: return "improved";
  case CoverageChange::Unchanged: return "unchanged";
  }
  return "unchanged";
}

bool ValidateCoverageConfig(const CoverageConfig& cfg, std::string& outError)
{
  if (!std::isfinite(cfg.cellSize) || cfg.cellSize <= 0.0) {
    outError = "coverage cell size must be > 0";
    return false;
  }
  if (!(cfg.excellentSec > 0.0) || cfg.goodSec < cfg.excellentSec || cfg.fairSec < cfg.goodSec ||
      cfg.maxResponseSec < cfg.fairSec || !std::isfinite(cfg.maxResponseSec)) {
    outError = "coverage thresholds must be positive and ascending (excellent <= good <= fair <= max)";
    return false;
  }
  outError.clear();
  return true;
}

CoverageLevel ClassifyResponseTime(double seconds, const CoverageConfig& cfg)
{
  if (!std::isfinite(seconds) || seconds < 0.0 || seconds > cfg.maxResponseSec) return CoverageLevel::Unreachable;
  if (seconds <= cfg.excellentSec) return CoverageLevel::Excellent;
  if (seconds <= cfg.goodSec) return CoverageLevel::Good;
  if (seconds <= cfg.fairSec) return CoverageLevel::Fair;
  return CoverageLevel::Poor;
}

std::vector<CoverageCell> BuildCoverageGrid(const MapBounds& bounds, double cellSize, int& outCols, int& outRows)
{
  std::vector<CoverageCell> out;
  outCols = 0;
  outRows = 0;
  if (!(cellSize > 0.0) || !(bounds.width() > 0.0) || !(bounds.height() > 0.0)) return out;

  outCols = static_cast<int>(std::ceil(bounds.width() / cellSize));
  outRows = static_cast<int>(std::ceil(bounds.height() / cellSize));
  out.reserve(static_cast<std::size_t>(outCols) * static_cast<std::size_t>(outRows));

  for (int row = 0; row < outRows; ++row) {
    for (int col = 0; col < outCols; ++col) {
      CoverageCell c;
      c.col = col;
      c.row = row;
      c.center.x = std::min(bounds.minX + (static_cast<double>(col) + 0.5) * cellSize, bounds.maxX - cellSize * 0.5);
      c.center.y = std::min(bounds.minY + (static_cast<double>(row) + 0.5) * cellSize, bounds.maxY - cellSize * 0.5);
      out.push_back(c);
    }
  }
  return out;
}

CoverageStats SummarizeCoverage(const std::vector<CoverageCell>& cells, double cellSize)
{
  CoverageStats s;
  s.cells = static_cast<int>(cells.size());

  std::vector<double> times;
  times.reserve(cells.size());
  for (const CoverageCell& c : cells) {
    s.byLevel[static_cast<std::size_t>(c.level)] += 1;
    if (c.level != CoverageLevel::Unreachable) times.push_back(c.responseSec);
  }

  const double cellKm2 = (cellSize * cellSize) / 1.0e6;
  s.reachable = static_cast<int>(times.size());
  s.coveragePct = cells.empty() ? 0.0 : 100.0 * static_cast<double>(s.reachable) / static_cast<double>(s.cells);
  s.avgResponseSec = MeanOf(times);
  s.medianResponseSec = MedianOf(times);
  s.maxResponseSec = times.empty() ? 0.0 : *std::max_element(times.begin(), times.end());
  s.blindAreaKm2 = static_cast<double>(s.byLevel[static_cast<std::size_t>(CoverageLevel::Unreachable)]) * cellKm2;
  s.totalAreaKm2 = static_cast<double>(s.cells) * cellKm2;
  return s;
}

bool AnalyzeServiceCoverage(RoadNetworkAnalyzer& analyzer, const MapBounds& bounds, const std::vector<Vec2>& stations,
                            const CoverageConfig& cfg, CoverageReport& out, std::string& outError)
{
  out = CoverageReport{};
  if (!ValidateCoverageConfig(cfg, outError)) return false;
  if (stations.empty()) {
    outError = "coverage analysis needs at least one ambulance station";
    return false;
  }

  out.bounds = bounds;
  out.cellSize = cfg.cellSize;
  out.stations = static_cast<int>(stations.size());
  out.cells = BuildCoverageGrid(bounds, cfg.cellSize, out.cols, out.rows);
  if (out.cells.empty()) {
    outError = "map bounds are degenerate";
    return false;
  }

  PathRequest req;
  req.vehicle = DefaultVehicleProfile(cfg.vehicle);
  req.maxTravelTimeSec = cfg.maxResponseSec;

  for (CoverageCell& cell : out.cells) {
    req.end = cell.center;
    for (int si = 0; si < static_cast<int>(stations.size()); ++si) {
      req.start = stations[static_cast<std::size_t>(si)];

      PathResult pr;
      if (!analyzer.findPath(req, pr, outError)) {
        std::ostringstream oss;
        oss << "routing station " << si << " to cell (" << cell.col << "," << cell.row << ") failed: " << outError;
        outError = oss.str();
        return false;
      }
      if (pr.success && pr.travelTime < cell.responseSec) {
        cell.responseSec = pr.travelTime;
        cell.station = si;
      }
    }
    cell.level = ClassifyResponseTime(cell.responseSec, cfg);
    if (cell.level == CoverageLevel::Unreachable) {
      cell.responseSec = std::numeric_limits<double>::infinity();
      cell.station = -1;
    }
  }

  out.stats = SummarizeCoverage(out.cells, cfg.cellSize);
  outError.clear();
  return true;
}

CoverageChange ClassifyCoverageChange(double beforeSec, double afterSec)
{
  const bool before = std::isfinite(beforeSec);
  const bool after = std::isfinite(afterSec);

  if (before && !after) return CoverageChange::NewlyUnreachable;
  if (!before && after) return CoverageChange::NewlyReachable;
  if (!before && !after) return CoverageChange::StillUnreachable;

  const double delta = afterSec - beforeSec;
  if (delta > beforeSec * 0.5) return CoverageChange::SeverelyDegraded;
  if (delta > beforeSec * 0.2) return CoverageChange::ModeratelyDegraded;
  if (delta > 0.0) return CoverageChange::SlightlyDegraded;
  if (delta < 0.0) return CoverageChange::Improved;
  return CoverageChange::Unchanged;
}

bool CompareCoverage(const CoverageReport& before, const CoverageReport& after, CoverageComparison& out,
                     std::string& outError)
{
  out = CoverageComparison{};
  if (before.cols != after.cols || before.rows != after.rows || before.cells.size() != after.cells.size() ||
      before.cellSize != after.cellSize) {
    outError = "coverage reports use different grids";
    return false;
  }

  std::vector<double> increases;
  out.cells.reserve(before.cells.size());
  for (std::size_t i = 0; i < before.cells.size(); ++i) {
    const double b = before.cells[i].responseSec;
    const double a = after.cells[i].responseSec;
    const CoverageChange c = ClassifyCoverageChange(b, a);
    out.cells.push_back(c);
    out.counts[static_cast<std::size_t>(c)] += 1;

    if (std::isfinite(a) && std::isfinite(b)) {
      increases.push_back(a - b);
      if (a > b) ++out.degradedCells;
    }
  }

  out.coverageChangePct = after.stats.coveragePct - before.stats.coveragePct;
  out.avgIncreaseSec = MeanOf(increases);
  out.medianIncreaseSec = MedianOf(increases);
  outError.clear();
  return true;
}

} // namespace urbanres
