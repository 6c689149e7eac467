#include "cli/CliCommon.hpp"

#include "urbanres/Export.hpp"
#include "urbanres/Isochrone.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/Vehicle.hpp"

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

  bool haveCenter = false;
  Vec2 center;
  VehicleType vehicle = VehicleType::Ambulance;

  double budgetSec = 900.0;
  double intervalSec = 300.0;
  std::vector<double> thresholds; // overrides budget/interval when set

  std::string outJson;
};

void PrintHelp()
{
  std::cout << "urbanres_isochrone (travel-time service areas from a point)\n\n";
  PrintCommonHelp(std::cout);
  std::cout << "\n";
  PrintObstructionHelp(std::cout);
  std::cout << "\nQuery:\n"
            << "  --at <x,y>                Center point in meters (required).\n"
            << "  --vehicle <name>          pedestrian|motorcycle|car|ambulance|fire_truck. Default: ambulance\n"
            << "  --budget <sec>            Largest travel time. Default: 900\n"
            << "  --interval <sec>          Band spacing below the budget. Default: 300\n"
            << "  --thresholds <a,b,...>    Explicit band thresholds in seconds.\n\n"
            << "Outputs:\n"
            << "  --json <out.json>         Bands with hulls and areas.\n\n"
            << "Exit codes:\n"
            << "  0  success\n"
            << "  1  runtime failure\n"
            << "  2  usage error\n";
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
    if (arg == "--at") {
      if (!hasValue || !ParseVec2(argv[++i], &opt.center.x, &opt.center.y)) {
        std::cerr << "--at requires format x,y in meters\n";
        return 2;
      }
      opt.haveCenter = true;
    } else if (arg == "--vehicle") {
      if (!hasValue || !ParseVehicleType(argv[++i], opt.vehicle)) {
        std::cerr << "--vehicle requires one of: pedestrian, motorcycle, car, ambulance, fire_truck\n";
        return 2;
      }
    } else if (arg == "--budget") {
      if (!hasValue || !ParseF64(argv[++i], &opt.budgetSec) || !(opt.budgetSec > 0.0)) {
        std::cerr << "--budget requires a positive number of seconds\n";
        return 2;
      }
    } else if (arg == "--interval") {
      if (!hasValue || !ParseF64(argv[++i], &opt.intervalSec) || !(opt.intervalSec > 0.0)) {
        std::cerr << "--interval requires a positive number of seconds\n";
        return 2;
      }
    } else if (arg == "--thresholds") {
      if (!hasValue || !ParseF64List(argv[++i], &opt.thresholds)) {
        std::cerr << "--thresholds requires a comma-separated list of seconds\n";
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

  if (!opt.haveCenter) {
    std::cerr << "Missing required --at\n";
    PrintHelp();
    return 2;
  }

  LogTee tee;
  if (!StartToolLog(opt.common, tee)) return 2;

  CombinedConfig cfg;
  if (!LoadToolConfig(opt.common, cfg)) return 2;

  std::string err;
  if (!ValidateAnalyzerConfig(cfg.analyzer, err)) {
    std::cerr << "Invalid analyzer config: " << err << "\n";
    return 2;
  }

  Scenario world;
  if (!LoadToolScenario(opt.common, cfg, world)) return 1;

  std::vector<RoadObstruction> obstructions;
  if (!LoadToolObstructions(opt.obstructions, cfg, world, obstructions)) return 1;

  RoadNetworkAnalyzer analyzer(world.map.graph, cfg.analyzer);
  ApplyToolObstructions(analyzer, obstructions, opt.common.quiet);

  ServiceAreaRequest req;
  req.center = opt.center;
  req.vehicle = DefaultVehicleProfile(opt.vehicle);
  req.thresholdsSec = opt.thresholds.empty() ? IsochroneThresholds(opt.budgetSec, opt.intervalSec) : opt.thresholds;

  ServiceAreaResult result;
  if (!analyzer.computeIsochrones(req, result, err)) {
    std::cerr << "Isochrone query failed: " << err << "\n";
    return 1;
  }
  ReportCleanupIssues(analyzer, "urbanres_isochrone");

  if (!opt.common.quiet) {
    std::cout << "vehicle: " << ToString(opt.vehicle) << "\n"
              << "attach: " << ToString(result.centerAttach.mode) << " (" << std::fixed << std::setprecision(1)
              << result.centerAttach.distance << " m)\n";
    for (const IsochroneBand& b : result.bands) {
      std::cout << "  <= " << b.thresholdSec << " s: " << b.nodeCount << " nodes, " << (b.areaM2 / 1.0e6)
                << " km2\n";
    }
  }

  if (!opt.outJson.empty()) {
    const bool ok = WriteJsonReport(opt.outJson, [&](JsonWriter& w) {
      return w.beginObject() && w.key("seed") && w.uintValue(world.seed) &&
             w.member("vehicle", ToString(opt.vehicle)) && w.key("service_area") && WriteServiceAreaJson(w, result) &&
             w.endObject();
    });
    if (!ok) return 1;
  }

  return 0;
}
