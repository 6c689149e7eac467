#include "cli/CliCommon.hpp"

#include "urbanres/Export.hpp"
#include "urbanres/Facilities.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/ServiceCoverage.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace urbanres;
using namespace urbanres::cli;

struct Options {
  CommonOptions common;
  ObstructionSource obstructions;

  bool haveCellSize = false;
  double cellSize = 100.0;
  bool haveVehicle = false;
  VehicleType vehicle = VehicleType::Ambulance;

  bool includeCells = true;
  std::string outJson;
};

void PrintHelp()
{
  std::cout << "urbanres_coverage (ambulance response-time coverage, before and after a disaster)\n\n";
  PrintCommonHelp(std::cout);
  std::cout << "\n";
  PrintObstructionHelp(std::cout);
  std::cout << "  With obstructions, the intact network is analyzed first and compared cell by cell.\n\n"
            << "Analysis:\n"
            << "  --cell <m>                Grid cell size (overrides the config).\n"
            << "  --vehicle <name>          Responding vehicle (overrides the config). Default: ambulance\n\n"
            << "Outputs:\n"
            << "  --json <out.json>         Coverage report(s) and comparison.\n"
            << "  --cells <0|1>             Include per-cell records in the JSON. Default: 1\n\n"
            << "Exit codes:\n"
            << "  0  success\n"
            << "  1  runtime failure\n"
            << "  2  usage error\n";
}

void PrintCoverage(const char* label, const CoverageReport& r)
{
  const CoverageStats& s = r.stats;
  std::cout << label << ": " << std::fixed << std::setprecision(1) << s.coveragePct << "% of " << s.cells
            << " cells reachable\n";
  for (int i = 0; i < kCoverageLevelCount; ++i) {
    std::cout << "  " << ToString(static_cast<CoverageLevel>(i)) << ": " << s.byLevel[static_cast<std::size_t>(i)]
              << "\n";
  }
  std::cout << "  response avg/median/max: " << s.avgResponseSec << " / " << s.medianResponseSec << " / "
            << s.maxResponseSec << " s\n"
            << "  blind area: " << std::setprecision(3) << s.blindAreaKm2 << " of " << s.totalAreaKm2 << " km2\n"
            << std::defaultfloat;
}

} // namespace

int main(int argc, char** argv)
{
  Options opt;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();

    if (arg == "-h" || arg == "--help") {
      PrintHelp();
      return 0;
    }

    ArgStatus st = ParseCommonArg(arg, i, argc, argv, opt.common);
    if (st == ArgStatus::NotMine) st = ParseObstructionArg(arg, i, argc, argv, opt.obstructions);
    if (st == ArgStatus::Error) return 2;
    if (st == ArgStatus::Consumed) continue;

    const bool hasValue = (i + 1 < argc);
    if (arg == "--cell") {
      if (!hasValue || !ParseF64(argv[++i], &opt.cellSize) || !(opt.cellSize > 0.0)) {
        std::cerr << "--cell requires a positive size in meters\n";
        return 2;
      }
      opt.haveCellSize = true;
    } else if (arg == "--vehicle") {
      if (!hasValue || !ParseVehicleType(argv[++i], opt.vehicle)) {
        std::cerr << "--vehicle requires one of: pedestrian, motorcycle, car, ambulance, fire_truck\n";
        return 2;
      }
      opt.haveVehicle = true;
    } else if (arg == "--cells") {
      if (!hasValue || !ParseBool01(argv[++i], &opt.includeCells)) {
        std::cerr << "--cells requires 0 or 1\n";
        return 2;
      }
    } else if (arg == "--json") {
      if (!hasValue) {
        std::cerr << "--json requires a path\n";
        return 2;
      }
      opt.outJson = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      PrintHelp();
      return 2;
    }
  }

  LogTee tee;
  if (!StartToolLog(opt.common, tee)) return 2;

  CombinedConfig cfg;
  if (!LoadToolConfig(opt.common, cfg)) return 2;
  if (opt.haveCellSize) cfg.coverage.cellSize = opt.cellSize;
  if (opt.haveVehicle) cfg.coverage.vehicle = opt.vehicle;

  std::string err;
  if (!ValidateCoverageConfig(cfg.coverage, err) || !ValidateAnalyzerConfig(cfg.analyzer, err)) {
    std::cerr << "Invalid config: " << err << "\n";
    return 2;
  }

  Scenario world;
  if (!LoadToolScenario(opt.common, cfg, world)) return 1;

  const std::vector<Vec2> stations = FacilityPositions(world.facilities, FacilityType::AmbulanceStation);
  if (stations.empty()) {
    std::cerr << "No ambulance stations in this world (facilities.ambulance_stations = 0)\n";
    return 1;
  }

  std::vector<RoadObstruction> obstructions;
  if (!LoadToolObstructions(opt.obstructions, cfg, world, obstructions)) return 1;
  const bool compare = !opt.obstructions.path.empty() || opt.obstructions.simulate;

  RoadNetworkAnalyzer analyzer(world.map.graph, cfg.analyzer);

  CoverageReport before;
  if (!AnalyzeServiceCoverage(analyzer, world.map.bounds, stations, cfg.coverage, before, err)) {
    std::cerr << "Coverage analysis failed: " << err << "\n";
    return 1;
  }

  CoverageReport after;
  CoverageComparison cmp;
  if (compare) {
    ApplyToolObstructions(analyzer, obstructions, opt.common.quiet);
    if (!AnalyzeServiceCoverage(analyzer, world.map.bounds, stations, cfg.coverage, after, err)) {
      std::cerr << "Coverage analysis failed: " << err << "\n";
      return 1;
    }
    if (!CompareCoverage(before, after, cmp, err)) {
      std::cerr << "Coverage comparison failed: " << err << "\n";
      return 1;
    }
  }
  ReportCleanupIssues(analyzer, "urbanres_coverage");

  if (!opt.common.quiet) {
    std::cout << "stations: " << stations.size() << "\n"
              << "grid: " << before.cols << "x" << before.rows << " cells of " << before.cellSize << " m\n";
    PrintCoverage(compare ? "before" : "coverage", before);
    if (compare) {
      PrintCoverage("after", after);
      std::cout << "coverage change: " << std::fixed << std::setprecision(1) << cmp.coverageChangePct << " points\n"
                << "degraded cells: " << cmp.degradedCells << "\n"
                << "response increase avg/median: " << cmp.avgIncreaseSec << " / " << cmp.medianIncreaseSec
                << " s\n";
      for (int i = 0; i < kCoverageChangeCount; ++i) {
        std::cout << "  " << ToString(static_cast<CoverageChange>(i)) << ": "
                  << cmp.counts[static_cast<std::size_t>(i)] << "\n";
      }
    }
  }

  if (!opt.outJson.empty()) {
    const bool ok = WriteJsonReport(opt.outJson, [&](JsonWriter& w) {
      if (!w.beginObject() || !w.key("seed") || !w.uintValue(world.seed) ||
          !w.member("vehicle", ToString(cfg.coverage.vehicle))) {
        return false;
      }
      if (!compare) return w.key("coverage") && WriteCoverageJson(w, before, opt.includeCells) && w.endObject();
      return w.key("before") && WriteCoverageJson(w, before, opt.includeCells) && w.key("after") &&
             WriteCoverageJson(w, after, opt.includeCells) && w.key("comparison") &&
             WriteCoverageComparisonJson(w, cmp, after) && w.endObject();
    });
    if (!ok) return 1;
  }

  return 0;
}
