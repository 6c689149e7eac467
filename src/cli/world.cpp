#include "cli/CliCommon.hpp"

#include "urbanres/ConfigIO.hpp"
#include "urbanres/Export.hpp"
#include "urbanres/Scenario.hpp"

#include <iostream>
#include <string>

namespace {

using namespace urbanres;
using namespace urbanres::cli;

struct Options {
  CommonOptions common;

  std::string outJson;
  std::string outTrees;
  std::string outConfig;
};

void PrintHelp()
{
  std::cout << "urbanres_world (synthesize a road map, plant roadside trees, place facilities)\n\n";
  PrintCommonHelp(std::cout);
  std::cout << "\nOutputs:\n"
            << "  --json <out.json>         World export: bounds, stats, graph, trees, facilities.\n"
            << "  --trees <out.json>        Tree inventory only ({\"trees\":[...]}, loadable with --trees-in).\n"
            << "  --write-config <out.json> Write the effective combined config.\n\n"
            << "Exit codes:\n"
            << "  0  success\n"
            << "  1  generation or output failed\n"
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

    std::string* target = nullptr;
    if (arg == "--json") target = &opt.outJson;
    else if (arg == "--trees") target = &opt.outTrees;
    else if (arg == "--write-config") target = &opt.outConfig;

    if (target) {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires a path\n";
        return 2;
      }
      *target = argv[++i];
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

  Scenario world;
  if (!LoadToolScenario(opt.common, cfg, world)) return 1;

  if (!opt.common.quiet) {
    const SynthesizedMap& m = world.map;
    const TreeStats ts = ComputeTreeStats(world.trees);
    std::cout << "seed: " << HexU64(world.seed) << "\n"
              << "size: " << m.bounds.width() << "x" << m.bounds.height() << " m\n"
              << "roads: main=" << m.mainRoads << " diagonal=" << m.diagonalRoads << " alleys=" << m.alleys << "\n"
              << "graph: nodes=" << m.graph.nodes.size() << " edges=" << CountActiveEdges(m.graph)
              << " crossings=" << m.intersections.crossings << "\n"
              << "trees: " << ts.total << " (I=" << ts.byLevel[0] << " II=" << ts.byLevel[1]
              << " III=" << ts.byLevel[2] << ")\n"
              << "facilities: " << world.facilities.size() << "\n";
  }

  std::string err;
  if (!opt.outJson.empty()) {
    if (!EnsureParentDir(opt.outJson) ||
        !WriteWorldJsonFile(opt.outJson, world.seed, world.map, world.trees, world.facilities, err)) {
      std::cerr << "Failed to write world JSON: " << opt.outJson << "\n" << err << "\n";
      return 1;
    }
  }
  if (!opt.outTrees.empty()) {
    if (!EnsureParentDir(opt.outTrees) || !WriteTreesJsonFile(opt.outTrees, world.trees, err)) {
      std::cerr << "Failed to write trees: " << opt.outTrees << "\n" << err << "\n";
      return 1;
    }
  }
  if (!opt.outConfig.empty()) {
    if (!EnsureParentDir(opt.outConfig) || !WriteCombinedConfigJsonFile(opt.outConfig, cfg, err)) {
      std::cerr << "Failed to write config: " << opt.outConfig << "\n" << err << "\n";
      return 1;
    }
  }

  return 0;
}
