#pragma once

// Options and setup steps every urbanres tool shares: world seed, combined config file,
// optional external tree inventory, log mirroring, and JSON report output.

#include "cli/CliParse.hpp"

#include "urbanres/ConfigIO.hpp"
#include "urbanres/Disaster.hpp"
#include "urbanres/Export.hpp"
#include "urbanres/Json.hpp"
#include "urbanres/LogTee.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/Scenario.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace urbanres::cli {

struct CommonOptions {
  std::uint64_t seed = 1;
  std::string configPath;
  std::string treesPath; // replaces the generated trees
  bool haveSize = false;
  double width = 0.0;
  double height = 0.0;

  std::string logPath;
  int logKeep = 3;

  bool quiet = false;
};

enum class ArgStatus : std::uint8_t {
  NotMine = 0,
  Consumed = 1,
  Error = 2,
};

inline void PrintCommonHelp(std::ostream& os)
{
  os << "World input:\n"
     << "  --seed <u64>              World seed, decimal or 0x... (default: 1).\n"
     << "  --config <file.json>      Combined config: {\"map\",\"trees\",\"facilities\",\"disaster\",\n"
     << "                            \"analyzer\",\"coverage\"}. Missing keys keep defaults.\n"
     << "  --size <WxH>              Map size in meters (overrides the config).\n"
     << "  --trees-in <file.json>    Use this tree inventory instead of planting trees.\n\n"
     << "Logging:\n"
     << "  --log <path>              Mirror stdout/stderr into a log file.\n"
     << "  --log-keep <N>            Rotated log backups to keep (default: 3).\n"
     << "  --quiet                   Suppress the stdout summary (errors still print).\n"
     << "  -h, --help                Show this help.\n";
}

inline ArgStatus ParseCommonArg(const std::string& arg, int& i, int argc, char** argv, CommonOptions& opt)
{
  auto value = [&](std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  std::string val;
  if (arg == "--seed") {
    if (!value(val) || !ParseU64(val, &opt.seed)) {
      std::cerr << "--seed requires a valid integer (decimal or 0x...)\n";
      return ArgStatus::Error;
    }
  } else if (arg == "--config") {
    if (!value(opt.configPath)) {
      std::cerr << "--config requires a path\n";
      return ArgStatus::Error;
    }
  } else if (arg == "--size") {
    if (!value(val) || !ParseWxH(val, &opt.width, &opt.height)) {
      std::cerr << "--size requires format WxH in meters (e.g. 2000x2000)\n";
      return ArgStatus::Error;
    }
    opt.haveSize = true;
  } else if (arg == "--trees-in") {
    if (!value(opt.treesPath)) {
      std::cerr << "--trees-in requires a path\n";
      return ArgStatus::Error;
    }
  } else if (arg == "--log") {
    if (!value(opt.logPath)) {
      std::cerr << "--log requires a path\n";
      return ArgStatus::Error;
    }
  } else if (arg == "--log-keep") {
    if (!value(val) || !ParseI32(val, &opt.logKeep) || opt.logKeep < 0) {
      std::cerr << "--log-keep requires an integer >= 0\n";
      return ArgStatus::Error;
    }
  } else if (arg == "--quiet") {
    opt.quiet = true;
  } else {
    return ArgStatus::NotMine;
  }
  return ArgStatus::Consumed;
}

inline bool StartToolLog(const CommonOptions& opt, LogTee& tee)
{
  if (opt.logPath.empty()) return true;

  LogTeeOptions lo;
  lo.path = opt.logPath;
  lo.keepFiles = opt.logKeep;
  std::string err;
  if (!tee.start(lo, err)) {
    std::cerr << "Failed to start log: " << err << "\n";
    return false;
  }
  return true;
}

inline bool LoadToolConfig(const CommonOptions& opt, CombinedConfig& cfg)
{
  std::string err;
  if (!opt.configPath.empty() && !LoadCombinedConfigJsonFile(opt.configPath, cfg, err)) {
    std::cerr << "Failed to load config: " << opt.configPath << "\n" << err << "\n";
    return false;
  }
  if (opt.haveSize) {
    cfg.map.width = opt.width;
    cfg.map.height = opt.height;
  }
  return true;
}

inline bool LoadToolScenario(const CommonOptions& opt, const CombinedConfig& cfg, Scenario& out)
{
  std::string err;
  if (opt.treesPath.empty()) {
    if (!BuildScenario(cfg, opt.seed, out, err)) {
      std::cerr << "Failed to generate world (seed " << HexU64(opt.seed) << "): " << err << "\n";
      return false;
    }
    return true;
  }

  std::vector<Tree> trees;
  if (!LoadTreesJsonFile(opt.treesPath, trees, err)) {
    std::cerr << "Failed to load trees: " << err << "\n";
    return false;
  }
  if (!BuildScenarioWithTrees(cfg, opt.seed, std::move(trees), out, err)) {
    std::cerr << "Failed to generate world (seed " << HexU64(opt.seed) << "): " << err << "\n";
    return false;
  }
  return true;
}

// Where a routing tool gets its obstructions: a file written by urbanres_disaster, or an
// inline collapse run with a pinned seed. Neither means an intact network.
struct ObstructionSource {
  std::string path;
  bool simulate = false;
  std::uint64_t disasterSeed = 0;
};

inline void PrintObstructionHelp(std::ostream& os)
{
  os << "Obstructions (default: intact network):\n"
     << "  --obstructions-in <file>  Obstruction set or full disaster export.\n"
     << "  --disaster-seed <u64>     Run a tree-collapse disaster inline with this seed.\n";
}

inline ArgStatus ParseObstructionArg(const std::string& arg, int& i, int argc, char** argv, ObstructionSource& src)
{
  if (arg == "--obstructions-in") {
    if (i + 1 >= argc) {
      std::cerr << "--obstructions-in requires a path\n";
      return ArgStatus::Error;
    }
    src.path = argv[++i];
  } else if (arg == "--disaster-seed") {
    if (i + 1 >= argc || !ParseU64(argv[++i], &src.disasterSeed)) {
      std::cerr << "--disaster-seed requires a valid integer (decimal or 0x...)\n";
      return ArgStatus::Error;
    }
    src.simulate = true;
  } else {
    return ArgStatus::NotMine;
  }
  return ArgStatus::Consumed;
}

inline bool LoadToolObstructions(const ObstructionSource& src, const CombinedConfig& cfg, const Scenario& world,
                                 std::vector<RoadObstruction>& out)
{
  out.clear();
  std::string err;
  if (!src.path.empty() && src.simulate) {
    std::cerr << "--obstructions-in and --disaster-seed are mutually exclusive\n";
    return false;
  }
  if (!src.path.empty()) {
    if (!LoadObstructionsJsonFile(src.path, out, err)) {
      std::cerr << "Failed to load obstructions: " << err << "\n";
      return false;
    }
    return true;
  }
  if (src.simulate) {
    DisasterResult result;
    if (!SimulateTreeCollapse(world.map.graph, world.trees, cfg.disaster, src.disasterSeed, result, err)) {
      std::cerr << "Disaster simulation failed: " << err << "\n";
      return false;
    }
    out = std::move(result.obstructions);
  }
  return true;
}

// Applies `obstructions` and reports entries the graph could not use.
inline void ApplyToolObstructions(RoadNetworkAnalyzer& analyzer, const std::vector<RoadObstruction>& obstructions,
                                  bool quiet)
{
  const ObstructionApplyStats st = analyzer.applyObstructions(obstructions);
  if (st.unknownEdges > 0 || st.invalidWidths > 0) {
    std::cerr << "warning: ignored " << st.unknownEdges << " obstruction(s) on unknown edges and "
              << st.invalidWidths << " with invalid widths\n";
  }
  if (!quiet) {
    std::cout << "obstructions: " << st.obstructions << " on " << st.edgesObstructed << " edges\n";
  }
}

// Rollback drift means a query left the graph in an unexpected state; the tool still
// finishes but says so.
inline void ReportCleanupIssues(const RoadNetworkAnalyzer& analyzer, const char* tool)
{
  const int issues = analyzer.cleanupIssues();
  if (issues <= 0) return;
  std::cerr << tool << ": warning: " << issues << " query cleanup(s) detected graph drift: "
            << analyzer.lastCleanupError() << "\n";
}

template <typename Fn>
bool WriteJsonReport(const std::string& path, Fn&& body)
{
  if (!EnsureParentDir(path)) {
    std::cerr << "Failed to create output directory for " << path << "\n";
    return false;
  }
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    std::cerr << "Failed to open " << path << "\n";
    return false;
  }

  JsonWriter w(f);
  if (!body(w) || !w.finished()) {
    std::cerr << "Failed to write JSON: " << path << "\n" << (w.ok() ? "incomplete document" : w.error()) << "\n";
    return false;
  }
  f << '\n';
  if (!f) {
    std::cerr << "Failed to write " << path << "\n";
    return false;
  }
  return true;
}

} // namespace urbanres::cli
