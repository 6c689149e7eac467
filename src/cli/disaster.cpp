#include "cli/CliCommon.hpp"

#include "urbanres/Disaster.hpp"
#include "urbanres/Export.hpp"
#include "urbanres/Random.hpp"

#include <iomanip>
#include <iostream>
#include <string>

namespace {

using namespace urbanres;
using namespace urbanres::cli;

struct Options {
  CommonOptions common;

  bool haveDisasterSeed = false;
  std::uint64_t disasterSeed = 0;
  bool haveIntensity = false;
  double intensity = 5.0;

  std::string outJson;
  std::string outObstructions;
};

void PrintHelp()
{
  std::cout << "urbanres_disaster (tree-collapse disaster over a synthesized road network)\n\n";
  PrintCommonHelp(std::cout);
  std::cout << "\nDisaster:\n"
            << "  --disaster-seed <u64>     Collapse seed. Default: derived from the clock (printed).\n"
            << "  --intensity <1..10>       Disaster intensity (overrides the config).\n\n"
            << "Outputs:\n"
            << "  --json <out.json>         Events, obstructions and stats.\n"
            << "  --obstructions <out.json> Obstruction set only (input for urbanres_route/coverage).\n\n"
            << "Exit codes:\n"
            << "  0  success\n"
            << "  1  simulation or output failed\n"
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

    const ArgStatus st = ParseCommonArg(arg, i, argc, argv, opt.common);
    if (st == ArgStatus::Error) return 2;
    if (st == ArgStatus::Consumed) continue;

    if (arg == "--disaster-seed") {
      if (i + 1 >= argc || !ParseU64(argv[++i], &opt.disasterSeed)) {
        std::cerr << "--disaster-seed requires a valid integer (decimal or 0x...)\n";
        return 2;
      }
      opt.haveDisasterSeed = true;
    } else if (arg == "--intensity") {
      if (i + 1 >= argc || !ParseF64(argv[++i], &opt.intensity)) {
        std::cerr << "--intensity requires a number in [1,10]\n";
        return 2;
      }
      opt.haveIntensity = true;
    } else if (arg == "--json" || arg == "--obstructions") {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a path\n";
        return 2;
      }
      (arg == "--json" ? opt.outJson : opt.outObstructions) = argv[++i];
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
  if (opt.haveIntensity) cfg.disaster.intensity = opt.intensity;

  std::string err;
  if (!ValidateDisasterConfig(cfg.disaster, err)) {
    std::cerr << "Invalid disaster config: " << err << "\n";
    return 2;
  }

  Scenario world;
  if (!LoadToolScenario(opt.common, cfg, world)) return 1;

  const std::uint64_t disasterSeed = opt.haveDisasterSeed ? opt.disasterSeed : TimeSeed();

  DisasterResult result;
  if (!SimulateTreeCollapse(world.map.graph, world.trees, cfg.disaster, disasterSeed, result, err)) {
    std::cerr << "Disaster simulation failed: " << err << "\n";
    return 1;
  }

  if (!opt.common.quiet) {
    const DisasterStats& s = result.stats;
    std::cout << "world seed: " << HexU64(world.seed) << "\n"
              << "disaster seed: " << HexU64(disasterSeed) << "\n"
              << "intensity: " << cfg.disaster.intensity << "\n"
              << "trees: evaluated=" << s.treesEvaluated << " skipped=" << s.treesSkipped << "\n"
              << "collapsed: " << s.collapsed << " (I=" << s.collapsedByLevel[0] << " II=" << s.collapsedByLevel[1]
              << " III=" << s.collapsedByLevel[2] << ")\n"
              << "obstructions: " << s.obstructions << " on " << s.roadsAffected << " roads";
    if (s.approximateObstructions > 0) std::cout << " (" << s.approximateObstructions << " approximate)";
    std::cout << "\n"
              << std::fixed << std::setprecision(1) << "blocked length: " << s.totalBlockedLength << " m\n"
              << "average blockage: " << s.averageBlockagePct << "%\n";
  }

  if (!opt.outJson.empty()) {
    if (!EnsureParentDir(opt.outJson) || !WriteDisasterJsonFile(opt.outJson, result, cfg.disaster, err)) {
      std::cerr << "Failed to write disaster JSON: " << opt.outJson << "\n" << err << "\n";
      return 1;
    }
  }
  if (!opt.outObstructions.empty()) {
    if (!EnsureParentDir(opt.outObstructions) ||
        !WriteObstructionsJsonFile(opt.outObstructions, result.obstructions, err)) {
      std::cerr << "Failed to write obstructions: " << opt.outObstructions << "\n" << err << "\n";
      return 1;
    }
  }

  return 0;
}
