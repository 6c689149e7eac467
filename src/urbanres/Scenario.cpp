#include "urbanres/Scenario.hpp"

#include <utility>

namespace urbanres {

namespace {

bool BuildMapAndFacilities(const CombinedConfig& cfg, std::uint64_t seed, Scenario& out, std::string& outError)
{
  out.seed = seed;
  if (!SynthesizeRoadMap(cfg.map, seed, out.map, outError)) return false;

  RNG facilityRng(DeriveSeed(seed, kFacilitySeedSalt));
  if (!PlaceFacilities(out.map, cfg.facilities, facilityRng, out.facilities, outError)) {
    outError = "facility placement failed: " + outError;
    return false;
  }
  return true;
}

} // namespace

bool BuildScenario(const CombinedConfig& cfg, std::uint64_t seed, Scenario& out, std::string& outError)
{
  out = Scenario{};
  if (!ValidateTreePlantingConfig(cfg.trees, outError)) return false;
  if (!BuildMapAndFacilities(cfg, seed, out, outError)) return false;

  RNG treeRng(DeriveSeed(seed, kTreeSeedSalt));
  out.trees = PlantRoadsideTrees(out.map.graph, cfg.trees, treeRng);

  outError.clear();
  return true;
}

bool BuildScenarioWithTrees(const CombinedConfig& cfg, std::uint64_t seed, std::vector<Tree> trees, Scenario& out,
                            std::string& outError)
{
  out = Scenario{};
  if (!BuildMapAndFacilities(cfg, seed, out, outError)) return false;
  out.trees = std::move(trees);

  outError.clear();
  return true;
}

} // namespace urbanres
