#include "urbanres/TreePlanting.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace urbanres {

namespace {

VulnerabilityLevel PickLevel(const TreePlantingConfig& cfg, RNG& rng)
{
  double total = 0.0;
  for (const double w : cfg.levelWeights) total += w;
  if (!(total > 0.0)) return VulnerabilityLevel::III;

  double r = rng.nextF01() * total;
  for (int i = 0; i < kVulnerabilityLevelCount; ++i) {
    r -= cfg.levelWeights[static_cast<std::size_t>(i)];
    if (r < 0.0) return static_cast<VulnerabilityLevel>(i);
  }
  return VulnerabilityLevel::III;
}

void PlantSide(const RoadGraph& g, const RoadGraphEdge& e, double side, const TreePlantingConfig& cfg, RNG& rng,
               std::vector<Tree>& out)
{
  const Vec2 a = g.nodes[static_cast<std::size_t>(e.a)].pos;
  const Vec2 b = g.nodes[static_cast<std::size_t>(e.b)].pos;
  const Vec2 d = b - a;
  const double len = Length(d);
  if (len < cfg.spacing || len <= 0.0) return;

  const Vec2 perp = Perp(d * (1.0 / len));
  const double baseDist = e.originalWidth * 0.5 + cfg.roadBuffer;
  const int count = static_cast<int>(len / cfg.spacing);

  for (int i = 0; i < count; ++i) {
    double t = (static_cast<double>(i) + 0.5 + rng.rangeDouble(-0.3, 0.3)) / static_cast<double>(count);
    t = std::clamp(t, 0.1, 0.9);

    const Vec2 base = a + d * t;
    const double offset = baseDist + rng.rangeDouble(0.0, cfg.maxOffset);

    Tree tree;
    tree.id = static_cast<int>(out.size());
    tree.pos = base + perp * (side * offset);
    tree.level = PickLevel(cfg, rng);
    SampleTreeDimensions(cfg, tree.level, rng, tree.height, tree.trunkWidth);
    out.push_back(tree);
  }
}

} // namespace

const char* ToString(VulnerabilityLevel v)
{
  switch (v) {
  case VulnerabilityLevel::I: return "I";
  case VulnerabilityLevel::II: return "II";
  case VulnerabilityLevel::III: return "III";
  }
  return "III";
}

bool ParseVulnerabilityLevel(const std::string& s, VulnerabilityLevel& out)
{
  if (s == "I" || s == "1") {
    out = VulnerabilityLevel::I;
    return true;
  }
  if (s == "II" || s == "2") {
    out = VulnerabilityLevel::II;
    return true;
  }
  if (s == "III" || s == "3") {
    out = VulnerabilityLevel::III;
    return true;
  }
  return false;
}

bool ValidateTreePlantingConfig(const TreePlantingConfig& cfg, std::string& outError)
{
  if (!(cfg.spacing > 0.0)) {
    outError = "tree spacing must be > 0";
    return false;
  }
  if (!(cfg.maxOffset >= 0.0) || !(cfg.roadBuffer >= 0.0)) {
    outError = "tree offsets must be >= 0";
    return false;
  }
  double total = 0.0;
  for (const double w : cfg.levelWeights) {
    if (!(w >= 0.0)) {
      outError = "vulnerability weights must be >= 0";
      return false;
    }
    total += w;
  }
  if (!(total > 0.0)) {
    outError = "vulnerability weights must not all be zero";
    return false;
  }
  if (!(cfg.minHeight > 0.0) || cfg.maxHeight < cfg.minHeight) {
    outError = "tree height range is invalid";
    return false;
  }
  if (!(cfg.minTrunkWidth > 0.0) || cfg.maxTrunkWidth < cfg.minTrunkWidth) {
    outError = "trunk width range is invalid";
    return false;
  }
  outError.clear();
  return true;
}

void SampleTreeDimensions(const TreePlantingConfig& cfg, VulnerabilityLevel level, RNG& rng, double& outHeight,
                          double& outTrunkWidth)
{
  // Older, larger trees are the most likely to fall.
  double hf = 0.0;
  double tf = 0.0;
  switch (level) {
  case VulnerabilityLevel::I:
    hf = rng.rangeDouble(0.7, 1.0);
    tf = rng.rangeDouble(0.8, 1.0);
    break;
  case VulnerabilityLevel::II:
    hf = rng.rangeDouble(0.4, 0.8);
    tf = rng.rangeDouble(0.5, 0.8);
    break;
  case VulnerabilityLevel::III:
    hf = rng.rangeDouble(0.2, 0.6);
    tf = rng.rangeDouble(0.2, 0.6);
    break;
  }

  double h = cfg.minHeight + hf * (cfg.maxHeight - cfg.minHeight);
  double w = cfg.minTrunkWidth + tf * (cfg.maxTrunkWidth - cfg.minTrunkWidth);
  h += rng.gaussian(0.0, h * 0.10);
  w += rng.gaussian(0.0, w * 0.15);

  outHeight = std::max(2.0, h);
  outTrunkWidth = std::max(0.1, w);
}

std::vector<Tree> PlantRoadsideTrees(const RoadGraph& g, const TreePlantingConfig& cfg, RNG& rng)
{
  std::vector<Tree> out;
  const int n = static_cast<int>(g.nodes.size());

  for (const RoadGraphEdge& e : g.edges) {
    if (!e.active || e.roadClass == RoadClass::Access) continue;
    if (e.a < 0 || e.a >= n || e.b < 0 || e.b >= n) continue;

    PlantSide(g, e, 1.0, cfg, rng, out);
    if (cfg.bothSides) PlantSide(g, e, -1.0, cfg, rng, out);
  }

  return out;
}

TreeStats ComputeTreeStats(const std::vector<Tree>& trees)
{
  TreeStats s;
  s.total = static_cast<int>(trees.size());
  if (trees.empty()) return s;

  s.minHeight = trees.front().height;
  s.maxHeight = trees.front().height;
  s.minTrunkWidth = trees.front().trunkWidth;
  s.maxTrunkWidth = trees.front().trunkWidth;

  double sumHeight = 0.0;
  for (const Tree& t : trees) {
    s.byLevel[static_cast<std::size_t>(t.level)] += 1;
    s.minHeight = std::min(s.minHeight, t.height);
    s.maxHeight = std::max(s.maxHeight, t.height);
    s.minTrunkWidth = std::min(s.minTrunkWidth, t.trunkWidth);
    s.maxTrunkWidth = std::max(s.maxTrunkWidth, t.trunkWidth);
    sumHeight += t.height;
  }
  s.avgHeight = sumHeight / static_cast<double>(trees.size());
  return s;
}

} // namespace urbanres
