#include "cli/CliCommon.hpp"

#include "urbanres/Export.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/Vehicle.hpp"

#include <iomanip>
#include <limits>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace urbanres;
using namespace urbanres::cli;

struct Options {
  CommonOptions common;
  ObstructionSource obstructions;

  bool haveFrom = false;
  bool haveTo = false;
  Vec2 from;
  Vec2 to;
  VehicleType vehicle = VehicleType::Ambulance;
  double maxTimeSec = std::numeric_limits<double>::infinity();

  int alternatives = 0; // 0: single path
  bool connectivity = false;

  std::string outJson;
};

void PrintHelp()
{
  std::cout << "urbanres_route (vehicle routing over a possibly obstructed road network)\n\n";
  PrintCommonHelp(std::cout);
  std::cout << "\n";
  PrintObstructionHelp(std::cout);
  std::cout << "\nQuery:\n"
            << "  --from <x,y>              Start point in meters (required unless --connectivity only).\n"
            << "  --to <x,y>                End point in meters.\n"
            << "  --vehicle <name>          pedestrian|motorcycle|car|ambulance|fire_truck. Default: ambulance\n"
            << "  --max-time <sec>          Travel-time limit for the search.\n"
            << "  --alternatives <N>        Also search up to N diverse alternative paths.\n"
            << "  --connectivity            Report the passable network structure for the vehicle.\n\n"
            << "Outputs:\n"
            << "  --json <out.json>         Path / alternatives / connectivity report.\n\n"
            << "Exit codes:\n"
            << "  0  success (complete path when a path was requested)\n"
            << "  1  no complete path, or a runtime failure\n"
            << "  2  usage error\n";
}

void PrintPath(const char* label, const PathResult& p)
{
  std::cout << label << ": " << (p.success ? "found" : (p.isPartial ? "partial" : "none"));
  if (p.reason != PathReason::None) std::cout << " (" << ToString(p.reason) << ")";
  std::cout << "\n";
  if (p.coords.empty()) return;

  std::cout << std::fixed << std::setprecision(1) << "  distance: " << p.distance << " m\n"
            << "  travel time: " << p.travelTime << " s\n"
            << std::defaultfloat << "  roads: " << p.edges.size() << "\n"
            << "  obstructed roads on path: " << p.blockedRoads.size() << "\n"
            << "  expansions: " << p.expansions << "\n";
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
    if (arg == "--from" || arg == "--to") {
      Vec2& p = (arg == "--from") ? opt.from : opt.to;
      if (!hasValue || !ParseVec2(argv[++i], &p.x, &p.y)) {
        std::cerr << arg << " requires format x,y in meters (e.g. 120.5,300)\n";
        return 2;
      }
      ((arg == "--from") ? opt.haveFrom : opt.haveTo) = true;
    } else if (arg == "--vehicle") {
      if (!hasValue || !ParseVehicleType(argv[++i], opt.vehicle)) {
        std::cerr << "--vehicle requires one of: pedestrian, motorcycle, car, ambulance, fire_truck\n";
        return 2;
      }
    } else if (arg == "--max-time") {
      if (!hasValue || !ParseF64(argv[++i], &opt.maxTimeSec) || !(opt.maxTimeSec > 0.0)) {
        std::cerr << "--max-time requires a positive number of seconds\n";
        return 2;
      }
    } else if (arg == "--alternatives") {
      if (!hasValue || !ParseI32(argv[++i], &opt.alternatives) || opt.alternatives < 1) {
        std::cerr << "--alternatives requires a positive integer\n";
        return 2;
      }
    } else if (arg == "--connectivity") {
      opt.connectivity = true;
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

  const bool wantPath = opt.haveFrom || opt.haveTo;
  if (wantPath && !(opt.haveFrom && opt.haveTo)) {
    std::cerr << "--from and --to must be given together\n";
    return 2;
  }
  if (!wantPath && !opt.connectivity) {
    std::cerr << "Nothing to do: give --from/--to and/or --connectivity\n";
    PrintHelp();
    return 2;
  }

  LogTee tee;
  if (!StartToolLog(opt.common, tee)) return 2;

  CombinedConfig cfg;
  if (!LoadToolConfig(opt.common, cfg)) return 2;
  if (opt.alternatives > 0) cfg.analyzer.maxAlternativePaths = opt.alternatives;

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

  PathRequest req;
  req.start = opt.from;
  req.end = opt.to;
  req.vehicle = DefaultVehicleProfile(opt.vehicle);
  req.maxTravelTimeSec = opt.maxTimeSec;

  PathResult path;
  AlternativePathsResult alternatives;
  ConnectivityReport conn;
  int exitCode = 0;

  if (wantPath) {
    if (opt.alternatives > 0) {
      if (!analyzer.findAlternativePaths(req, alternatives, err)) {
        std::cerr << "Route query failed: " << err << "\n";
        return 1;
      }
      if (alternatives.paths.empty() || !alternatives.paths.front().success) exitCode = 1;
    } else {
      if (!analyzer.findPath(req, path, err)) {
        std::cerr << "Route query failed: " << err << "\n";
        return 1;
      }
      if (!path.success) exitCode = 1;
    }
  }

  if (opt.connectivity && !analyzer.analyzeConnectivity(req.vehicle, conn, err)) {
    std::cerr << "Connectivity analysis failed: " << err << "\n";
    return 1;
  }

  ReportCleanupIssues(analyzer, "urbanres_route");

  if (!opt.common.quiet) {
    std::cout << "vehicle: " << ToString(opt.vehicle) << "\n";
    if (wantPath && opt.alternatives > 0) {
      std::cout << "alternatives: " << alternatives.paths.size() << " of " << alternatives.attempts
                << " attempts\n";
      for (std::size_t k = 0; k < alternatives.paths.size(); ++k) {
        PrintPath(("path " + std::to_string(k + 1)).c_str(), alternatives.paths[k]);
      }
    } else if (wantPath) {
      PrintPath("path", path);
    }
    if (opt.connectivity) {
      std::cout << "passable roads: " << conn.passableEdges << "/" << conn.totalEdges << "\n"
                << "components: " << conn.components << (conn.fragmented ? " (fragmented)" : "") << "\n"
                << "critical roads: " << conn.bridgeEdges.size() << "\n";
    }
  }

  if (!opt.outJson.empty()) {
    const bool ok = WriteJsonReport(opt.outJson, [&](JsonWriter& w) {
      if (!w.beginObject() || !w.key("seed") || !w.uintValue(world.seed) ||
          !w.member("vehicle", ToString(opt.vehicle))) {
        return false;
      }
      if (wantPath && opt.alternatives > 0) {
        if (!w.member("attempts", alternatives.attempts) || !w.key("paths") || !w.beginArray()) return false;
        for (const PathResult& p : alternatives.paths) {
          if (!WritePathJson(w, p)) return false;
        }
        if (!w.endArray()) return false;
      } else if (wantPath) {
        if (!w.key("path") || !WritePathJson(w, path)) return false;
      }
      if (opt.connectivity && (!w.key("connectivity") || !WriteConnectivityJson(w, conn))) return false;
      return w.endObject();
    });
    if (!ok) return 1;
  }

  return exitCode;
}
