#include "urbanres/ConfigIO.hpp"
#include "urbanres/Disaster.hpp"
#include "urbanres/Export.hpp"
#include "urbanres/Facilities.hpp"
#include "urbanres/Geometry.hpp"
#include "urbanres/Isochrone.hpp"
#include "urbanres/Json.hpp"
#include "urbanres/MapSynth.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/RoadCost.hpp"
#include "urbanres/RoadGraph.hpp"
#include "urbanres/RoadGraphAttach.hpp"
#include "urbanres/RoadGraphConnectivity.hpp"
#include "urbanres/RoadGraphSearch.hpp"
#include "urbanres/Scenario.hpp"
#include "urbanres/ServiceCoverage.hpp"
#include "urbanres/TreePlanting.hpp"
#include "urbanres/Vehicle.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

namespace {

using namespace urbanres;

RoadSpec Secondary(double width = 6.0, bool bidirectional = true)
{
  RoadSpec s;
  s.roadClass = RoadClass::Secondary;
  s.width = width;
  s.lanes = 2;
  s.bidirectional = bidirectional;
  s.speedLimitKmh = 30.0;
  return s;
}

// n x n lattice with `step` spacing starting at `origin`. Node id = y * n + x.
RoadGraph MakeGrid(int n, double step, Vec2 origin = Vec2{0.0, 0.0})
{
  RoadGraph g;
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      AddRoadNode(g, Vec2{origin.x + step * x, origin.y + step * y});
    }
  }
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      const int id = y * n + x;
      if (x + 1 < n) AddRoadEdge(g, id, id + 1, Secondary());
      if (y + 1 < n) AddRoadEdge(g, id, id + n, Secondary());
    }
  }
  return g;
}

// Nodes along the x axis every `step` meters.
RoadGraph MakeLine(int nodes, double step)
{
  RoadGraph g;
  for (int i = 0; i < nodes; ++i) AddRoadNode(g, Vec2{step * i, 0.0});
  for (int i = 0; i + 1 < nodes; ++i) AddRoadEdge(g, i, i + 1, Secondary());
  return g;
}

// Structural fingerprint of a graph (positions, kinds, adjacency, edge attributes).
std::string GraphSignature(const RoadGraph& g)
{
  std::ostringstream oss;
  oss.precision(17);
  oss << g.nodes.size() << "/" << g.edges.size() << ";";
  for (const RoadGraphNode& n : g.nodes) {
    oss << n.pos.x << "," << n.pos.y << "," << static_cast<int>(n.kind) << "[";
    for (const int e : n.edges) oss << e << " ";
    oss << "]";
  }
  for (const RoadGraphEdge& e : g.edges) {
    oss << e.a << "-" << e.b << ":" << e.length << ":" << e.currentWidth << ":" << e.originalWidth << ":"
        << (e.active ? 1 : 0) << ":" << e.sourceEdge << ";";
  }
  return oss.str();
}

RoadObstruction Obstruct(int edge, double remaining)
{
  RoadObstruction o;
  o.edge = edge;
  o.remainingWidth = remaining;
  return o;
}

PathRequest Request(Vec2 a, Vec2 b, VehicleType v)
{
  PathRequest r;
  r.start = a;
  r.end = b;
  r.vehicle = DefaultVehicleProfile(v);
  return r;
}

void TestVehicleProfilesAndWidthPenalty()
{
  EXPECT_NEAR(DefaultVehicleProfile(VehicleType::Pedestrian).minRoadWidth, 0.8, 1e-12);
  EXPECT_NEAR(DefaultVehicleProfile(VehicleType::Motorcycle).minRoadWidth, 1.2, 1e-12);
  EXPECT_NEAR(DefaultVehicleProfile(VehicleType::Car).minRoadWidth, 2.2, 1e-12);
  EXPECT_NEAR(DefaultVehicleProfile(VehicleType::Ambulance).minRoadWidth, 3.0, 1e-12);
  EXPECT_NEAR(DefaultVehicleProfile(VehicleType::FireTruck).minRoadWidth, 3.5, 1e-12);

  VehicleType parsed = VehicleType::Car;
  EXPECT_TRUE(ParseVehicleType("fire_truck", parsed));
  EXPECT_EQ(parsed, VehicleType::FireTruck);
  EXPECT_TRUE(!ParseVehicleType("tank", parsed));

  RoadGraph g = MakeLine(2, 100.0);
  RoadGraphEdge& e = g.edges[0];
  const VehicleProfile car = DefaultVehicleProfile(VehicleType::Car);

  // 30 km/h limit, car max 50 km/h: 100 m take 12 s.
  EXPECT_NEAR(EdgeTraversalCost(e, car), 12.0, 1e-9);
  EXPECT_NEAR(WidthPenaltyMultiplier(e, car), 1.0, 1e-12);

  e.currentWidth = 4.5; // ratio 0.75
  EXPECT_NEAR(WidthPenaltyMultiplier(e, car), 1.5, 1e-12);
  EXPECT_NEAR(EdgeTraversalCost(e, car), 18.0, 1e-9);

  e.currentWidth = 3.0; // ratio 0.5
  EXPECT_NEAR(WidthPenaltyMultiplier(e, car), 2.0, 1e-12);

  e.currentWidth = 2.4; // ratio 0.4
  EXPECT_NEAR(WidthPenaltyMultiplier(e, car), 3.0, 1e-12);

  // Wide enough relative to the road but barely wider than the vehicle needs.
  RoadGraph narrow;
  AddRoadNode(narrow, Vec2{0.0, 0.0});
  AddRoadNode(narrow, Vec2{100.0, 0.0});
  AddRoadEdge(narrow, 0, 1, Secondary(2.5));
  EXPECT_NEAR(WidthPenaltyMultiplier(narrow.edges[0], car), 1.3, 1e-12);

  e.currentWidth = 2.0;
  EXPECT_TRUE(!IsEdgePassable(e, car));
  EXPECT_TRUE(std::isinf(EdgeTraversalCost(e, car)));
}

void TestLaneLayout()
{
  const std::vector<LaneInfo> two = BuildLaneInfo(2, 6.0, true);
  EXPECT_EQ(two.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(two[0].direction, LaneDirection::Forward);
  EXPECT_EQ(two[0].side, LaneSide::Right);
  EXPECT_EQ(two[1].direction, LaneDirection::Backward);
  EXPECT_EQ(two[1].side, LaneSide::Left);
  EXPECT_NEAR(two[0].width, 3.0, 1e-12);

  const std::vector<LaneInfo> oneWay = BuildLaneInfo(2, 6.0, false);
  for (const LaneInfo& l : oneWay) EXPECT_EQ(l.direction, LaneDirection::Forward);

  EXPECT_EQ(PrimaryDirection(Vec2{0.0, 0.0}, Vec2{10.0, 1.0}), CompassDirection::East);
  EXPECT_EQ(PrimaryDirection(Vec2{0.0, 0.0}, Vec2{-10.0, 1.0}), CompassDirection::West);
  EXPECT_EQ(PrimaryDirection(Vec2{0.0, 0.0}, Vec2{1.0, 10.0}), CompassDirection::North);
}

void TestMainRoadsShareCrossingNodes()
{
  MapSynthConfig cfg;
  cfg.mainRoadCount = 4;

  const std::vector<RoadSegment> mains = GenerateMainRoadSegments(cfg);
  EXPECT_EQ(mains.size(), static_cast<std::size_t>(4));

  IntersectionStats stats;
  const RoadGraph g = BuildRoadGraphFromSegments(mains, &stats);
  EXPECT_EQ(stats.crossings, 4);
  EXPECT_EQ(g.nodes.size(), static_cast<std::size_t>(12));
  EXPECT_EQ(CountActiveEdges(g), 12);

  int degree4 = 0;
  for (const RoadGraphNode& n : g.nodes) {
    if (n.edges.size() == 4) ++degree4;
  }
  EXPECT_EQ(degree4, 4);

  std::string err;
  EXPECT_TRUE(ValidateRoadGraph(g, err));
}

void TestSameSeedSameWorld()
{
  CombinedConfig cfg;
  cfg.map.width = 800.0;
  cfg.map.height = 800.0;

  Scenario a;
  Scenario b;
  std::string err;
  EXPECT_TRUE(BuildScenario(cfg, 42u, a, err));
  EXPECT_TRUE(BuildScenario(cfg, 42u, b, err));

  EXPECT_EQ(a.map.graph.nodes.size(), b.map.graph.nodes.size());
  EXPECT_EQ(a.map.graph.edges.size(), b.map.graph.edges.size());
  EXPECT_EQ(GraphSignature(a.map.graph), GraphSignature(b.map.graph));

  EXPECT_EQ(a.trees.size(), b.trees.size());
  for (std::size_t i = 0; i < std::min(a.trees.size(), b.trees.size()); ++i) {
    EXPECT_TRUE(a.trees[i].pos == b.trees[i].pos);
    EXPECT_EQ(a.trees[i].level, b.trees[i].level);
    EXPECT_EQ(a.trees[i].height, b.trees[i].height);
  }

  EXPECT_EQ(a.facilities.size(), b.facilities.size());
  for (std::size_t i = 0; i < std::min(a.facilities.size(), b.facilities.size()); ++i) {
    EXPECT_EQ(a.facilities[i].node, b.facilities[i].node);
    EXPECT_EQ(a.facilities[i].capacity, b.facilities[i].capacity);
  }

  EXPECT_TRUE(ValidateRoadGraph(a.map.graph, err));
  EXPECT_TRUE(a.map.mainRoads == 4);
  for (const Facility& f : a.facilities) {
    EXPECT_TRUE(f.node >= 0 && f.node < static_cast<int>(a.map.graph.nodes.size()));
  }

  // A supplied tree inventory leaves the road map and facilities untouched.
  Scenario c;
  std::vector<Tree> custom(1);
  custom[0].pos = Vec2{10.0, 10.0};
  EXPECT_TRUE(BuildScenarioWithTrees(cfg, 42u, custom, c, err));
  EXPECT_EQ(GraphSignature(c.map.graph), GraphSignature(a.map.graph));
  EXPECT_EQ(c.trees.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(c.facilities.size(), a.facilities.size());
}

void TestRoadsideTreePlacement()
{
  RoadGraph g = MakeLine(2, 100.0);

  TreePlantingConfig cfg;
  RNG rng(7u);
  const std::vector<Tree> trees = PlantRoadsideTrees(g, cfg, rng);

  // 100 m at 25 m spacing: four per side.
  EXPECT_EQ(trees.size(), static_cast<std::size_t>(8));
  for (std::size_t i = 0; i < trees.size(); ++i) {
    const Tree& t = trees[i];
    EXPECT_EQ(t.id, static_cast<int>(i));
    EXPECT_TRUE(t.pos.x >= 10.0 - 1e-9 && t.pos.x <= 90.0 + 1e-9);
    EXPECT_TRUE(std::fabs(t.pos.y) >= 6.0 - 1e-9 && std::fabs(t.pos.y) <= 14.0 + 1e-9);
    EXPECT_TRUE(t.height >= 2.0);
    EXPECT_TRUE(t.trunkWidth >= 0.1);
  }

  const TreeStats stats = ComputeTreeStats(trees);
  EXPECT_EQ(stats.total, 8);
  EXPECT_EQ(stats.byLevel[0] + stats.byLevel[1] + stats.byLevel[2], 8);

  VulnerabilityLevel lvl = VulnerabilityLevel::III;
  EXPECT_TRUE(ParseVulnerabilityLevel("II", lvl));
  EXPECT_EQ(lvl, VulnerabilityLevel::II);
  EXPECT_TRUE(!ParseVulnerabilityLevel("IV", lvl));
}

void TestFacilitiesNeedEnoughNodes()
{
  SynthesizedMap map;
  map.graph = MakeLine(3, 100.0);
  map.bounds = MapBounds{0.0, 0.0, 200.0, 200.0};

  FacilityConfig cfg;
  RNG rng(1u);
  std::vector<Facility> out;
  std::string err;
  EXPECT_TRUE(!PlaceFacilities(map, cfg, rng, out, err));
  EXPECT_TRUE(!err.empty());

  cfg.ambulanceStations = 1;
  cfg.shelters = 2;
  EXPECT_TRUE(PlaceFacilities(map, cfg, rng, out, err));
  EXPECT_EQ(out.size(), static_cast<std::size_t>(3));
  EXPECT_EQ(out[0].type, FacilityType::AmbulanceStation);
  EXPECT_EQ(out[1].type, FacilityType::Shelter);
  EXPECT_TRUE(out[1].capacity >= cfg.shelterCapacityMin && out[1].capacity <= cfg.shelterCapacityMax);

  // The middle node has degree 2 and wins the ranking.
  EXPECT_EQ(out[0].node, 1);
  EXPECT_EQ(FacilityPositions(out, FacilityType::Shelter).size(), static_cast<std::size_t>(2));
}

void TestCollapseProbability()
{
  DisasterConfig cfg;
  EXPECT_NEAR(CollapseProbability(VulnerabilityLevel::I, 10.0, cfg), 0.8, 1e-12);
  EXPECT_NEAR(CollapseProbability(VulnerabilityLevel::II, 10.0, cfg), 0.5, 1e-12);
  EXPECT_NEAR(CollapseProbability(VulnerabilityLevel::III, 5.0, cfg), 0.075, 1e-12);
  EXPECT_NEAR(CollapseProbability(VulnerabilityLevel::I, 0.0, cfg), 0.4, 1e-12);

  const Polygon p = BuildBlockagePolygon(Vec2{0.0, 0.0}, 0.0, 10.0, 1.0);
  EXPECT_EQ(p.size(), static_cast<std::size_t>(4));
  EXPECT_NEAR(PolygonArea(p), 10.0, 1e-9);

  cfg.intensity = 11.0;
  std::string err;
  EXPECT_TRUE(!ValidateDisasterConfig(cfg, err));
}

void TestBlockageUsesNarrowestCrossSection()
{
  const Vec2 a{0.0, 0.0};
  const Vec2 b{100.0, 0.0};
  const std::vector<LaneInfo> lanes = BuildLaneInfo(2, 6.0, false);
  DisasterConfig cfg;

  // Covers y in [-3, 1] over 10 m of a one-way 6 m road.
  const Polygon rect{{40.0, -3.0}, {50.0, -3.0}, {50.0, 1.0}, {40.0, 1.0}};
  RoadObstruction o;
  EXPECT_TRUE(MeasureRoadBlockage(a, b, 6.0, lanes, false, rect, cfg, o));
  EXPECT_NEAR(o.remainingWidth, 2.0, 1e-6);
  EXPECT_NEAR(o.blockedLength, 10.0, 1e-6);
  EXPECT_NEAR(o.blockedPercentage, 100.0 * 4.0 / 6.0, 1e-6);
  EXPECT_TRUE(!o.hasDirectional);
  EXPECT_TRUE(!o.approximate);

  // Partially covers the road at one end but fully closes it at the other: the pinch
  // point governs, not the blocked area.
  const Polygon trap{{40.0, -4.0}, {60.0, -4.0}, {60.0, 4.0}, {50.0, 4.0}};
  RoadObstruction t;
  EXPECT_TRUE(MeasureRoadBlockage(a, b, 6.0, lanes, false, trap, cfg, t));
  EXPECT_NEAR(t.remainingWidth, 0.0, 1e-6);
  EXPECT_NEAR(t.blockedPercentage, 100.0, 1e-6);

  // Off the road entirely.
  const Polygon away{{40.0, 5.0}, {50.0, 5.0}, {50.0, 8.0}, {40.0, 8.0}};
  RoadObstruction none;
  EXPECT_TRUE(!MeasureRoadBlockage(a, b, 6.0, lanes, false, away, cfg, none));
}

void TestDirectionalBlockage()
{
  const std::vector<LaneInfo> lanes = BuildLaneInfo(2, 6.0, true);
  DisasterConfig cfg;

  // Right-hand (forward) half is y in [-3, 0]; the obstacle takes 2 m of it.
  const Polygon rect{{40.0, -3.0}, {50.0, -3.0}, {50.0, -1.0}, {40.0, -1.0}};
  RoadObstruction o;
  EXPECT_TRUE(MeasureRoadBlockage(Vec2{0.0, 0.0}, Vec2{100.0, 0.0}, 6.0, lanes, true, rect, cfg, o));
  EXPECT_TRUE(o.hasDirectional);
  EXPECT_NEAR(o.forwardRemaining, 1.0, 1e-6);
  EXPECT_NEAR(o.backwardRemaining, 3.0, 1e-6);
  EXPECT_NEAR(o.remainingWidth, 1.0, 1e-6);
  EXPECT_TRUE(o.forwardAffected);
  EXPECT_TRUE(!o.backwardAffected);
}

void TestDegenerateEdgeUsesFixedBlockage()
{
  RoadGraph g;
  const int a = AddRoadNode(g, Vec2{10.0, 10.0});
  const int b = AddRoadNode(g, Vec2{10.0, 10.0});
  const int e = AddRoadEdge(g, a, b, Secondary(6.0));
  EXPECT_TRUE(e >= 0);

  TreeCollapseEvent ev;
  ev.id = 0;
  ev.location = Vec2{10.0, 10.0};
  ev.blockage = Polygon{{5.0, 5.0}, {15.0, 5.0}, {15.0, 15.0}, {5.0, 15.0}};

  DisasterConfig cfg;
  const std::vector<RoadObstruction> obs = ComputeRoadObstructions(g, {ev}, cfg);
  EXPECT_EQ(obs.size(), static_cast<std::size_t>(1));
  if (obs.size() != 1) return;
  EXPECT_EQ(obs[0].edge, e);
  EXPECT_TRUE(obs[0].approximate);
  EXPECT_NEAR(obs[0].remainingWidth, 1.8, 1e-9);
  EXPECT_NEAR(obs[0].blockedPercentage, 70.0, 1e-9);
  EXPECT_EQ(SummarizeDisaster({ev}, obs).approximateObstructions, 1);

  // One dangling endpoint: estimated from the endpoint that is still there.
  RoadGraph dangling = MakeLine(2, 100.0);
  dangling.edges[0].b = 99;
  TreeCollapseEvent atEnd;
  atEnd.id = 1;
  atEnd.blockage = Polygon{{-2.0, -2.0}, {2.0, -2.0}, {2.0, 2.0}, {-2.0, 2.0}};
  const std::vector<RoadObstruction> d = ComputeRoadObstructions(dangling, {atEnd}, cfg);
  EXPECT_EQ(d.size(), static_cast<std::size_t>(1));
  if (d.size() == 1) {
    EXPECT_TRUE(d[0].approximate);
    EXPECT_NEAR(d[0].remainingWidth, 6.0 * 0.3, 1e-9);
  }

  // Too far from the lone endpoint to touch the road.
  TreeCollapseEvent distant;
  distant.id = 2;
  distant.blockage = Polygon{{40.0, 40.0}, {45.0, 40.0}, {45.0, 45.0}, {40.0, 45.0}};
  EXPECT_TRUE(ComputeRoadObstructions(dangling, {distant}, cfg).empty());
}

void TestSimulateTreeCollapse()
{
  RoadGraph g = MakeLine(2, 100.0);

  std::vector<Tree> trees(3);
  trees[0].id = 0;
  trees[0].pos = Vec2{50.0, 5.0};
  trees[0].level = VulnerabilityLevel::I;
  trees[0].height = 20.0;
  trees[0].trunkWidth = 1.0;
  trees[1].id = 1;
  trees[1].pos = Vec2{20.0, -6.0};
  trees[1].level = VulnerabilityLevel::III;
  trees[1].height = 15.0;
  trees[1].trunkWidth = 0.8;
  trees[2].id = 2;
  trees[2].pos = Vec2{70.0, 6.0};
  trees[2].height = 0.0; // invalid

  DisasterConfig cfg;
  cfg.intensity = 10.0;
  cfg.baseRates = {{1.0, 1.0, 1.0}};

  DisasterResult r1;
  DisasterResult r2;
  std::string err;
  EXPECT_TRUE(SimulateTreeCollapse(g, trees, cfg, 99u, r1, err));
  EXPECT_TRUE(SimulateTreeCollapse(g, trees, cfg, 99u, r2, err));

  EXPECT_EQ(r1.stats.treesSkipped, 1);
  EXPECT_EQ(r1.stats.treesEvaluated, 2);
  EXPECT_EQ(r1.events.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(r1.stats.collapsedByLevel[0], 1);
  EXPECT_EQ(r1.stats.collapsedByLevel[2], 1);

  EXPECT_EQ(r1.events.size(), r2.events.size());
  EXPECT_EQ(r1.obstructions.size(), r2.obstructions.size());
  for (std::size_t i = 0; i < std::min(r1.events.size(), r2.events.size()); ++i) {
    EXPECT_EQ(r1.events[i].angleDeg, r2.events[i].angleDeg);
  }
  for (const RoadObstruction& o : r1.obstructions) {
    EXPECT_EQ(o.edge, 0);
    EXPECT_TRUE(o.remainingWidth >= 0.0 && o.remainingWidth <= 6.0);
  }
}

void TestNarrowedRoadBlocksCars()
{
  RoadNetworkAnalyzer analyzer(MakeLine(2, 100.0));
  const ObstructionApplyStats st = analyzer.applyObstructions({Obstruct(0, 2.0)});
  EXPECT_EQ(st.edgesObstructed, 1);

  std::string err;
  PathResult car;
  EXPECT_TRUE(analyzer.findPath(Request(Vec2{0.0, 0.0}, Vec2{100.0, 0.0}, VehicleType::Car), car, err));
  EXPECT_TRUE(!car.success);
  EXPECT_TRUE(car.isPartial);
  EXPECT_EQ(car.reason, PathReason::NoPath);
  EXPECT_TRUE(!car.coords.empty());
  EXPECT_TRUE(car.coords.front() == (Vec2{0.0, 0.0}));

  PathResult ambulance;
  EXPECT_TRUE(analyzer.findPath(Request(Vec2{0.0, 0.0}, Vec2{100.0, 0.0}, VehicleType::Ambulance), ambulance, err));
  EXPECT_TRUE(!ambulance.success);

  PathResult moto;
  EXPECT_TRUE(analyzer.findPath(Request(Vec2{0.0, 0.0}, Vec2{100.0, 0.0}, VehicleType::Motorcycle), moto, err));
  EXPECT_TRUE(moto.success);
  EXPECT_EQ(moto.edges.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(moto.blockedRoads.size(), static_cast<std::size_t>(1));
  EXPECT_NEAR(moto.distance, 100.0, 1e-9);
  // Ratio 1/3: three times the free-flow 12 s.
  EXPECT_NEAR(moto.travelTime, 36.0, 1e-9);
}

void TestObstructionResetAndMinimum()
{
  RoadNetworkAnalyzer analyzer(MakeLine(3, 100.0));

  analyzer.applyObstructions({Obstruct(0, 4.0)});
  EXPECT_NEAR(analyzer.snapshotGraph().edges[0].currentWidth, 4.0, 1e-12);

  // Applying is a full replacement, not cumulative.
  analyzer.applyObstructions({Obstruct(1, 5.0)});
  RoadGraph g = analyzer.snapshotGraph();
  EXPECT_NEAR(g.edges[0].currentWidth, 6.0, 1e-12);
  EXPECT_NEAR(g.edges[1].currentWidth, 5.0, 1e-12);

  // Order-independent minimum per edge.
  analyzer.applyObstructions({Obstruct(0, 4.0), Obstruct(0, 2.0), Obstruct(1, 5.0)});
  const RoadGraph fwd = analyzer.snapshotGraph();
  analyzer.applyObstructions({Obstruct(1, 5.0), Obstruct(0, 2.0), Obstruct(0, 4.0)});
  const RoadGraph rev = analyzer.snapshotGraph();
  EXPECT_NEAR(fwd.edges[0].currentWidth, 2.0, 1e-12);
  EXPECT_EQ(fwd.edges[0].currentWidth, rev.edges[0].currentWidth);
  EXPECT_EQ(fwd.edges[1].currentWidth, rev.edges[1].currentWidth);

  // Out-of-range widths are clamped; unknown edges and NaN widths are counted.
  const ObstructionApplyStats st = analyzer.applyObstructions(
      {Obstruct(0, 50.0), Obstruct(1, -3.0), Obstruct(17, 1.0), Obstruct(0, std::nan(""))});
  EXPECT_EQ(st.obstructions, 4);
  EXPECT_EQ(st.unknownEdges, 1);
  EXPECT_EQ(st.invalidWidths, 1);
  g = analyzer.snapshotGraph();
  EXPECT_NEAR(g.edges[0].currentWidth, 6.0, 1e-12);
  EXPECT_NEAR(g.edges[1].currentWidth, 0.0, 1e-12);
  for (const RoadGraphEdge& e : g.edges) {
    EXPECT_TRUE(e.currentWidth >= 0.0 && e.currentWidth <= e.originalWidth);
  }

  analyzer.applyObstructions({});
  g = analyzer.snapshotGraph();
  for (const RoadGraphEdge& e : g.edges) EXPECT_EQ(e.currentWidth, e.originalWidth);

  analyzer.applyObstructions({Obstruct(1, 1.0)});
  analyzer.clearObstructions();
  EXPECT_NEAR(analyzer.snapshotGraph().edges[1].currentWidth, 6.0, 1e-12);
}

void TestQueriesLeaveGraphUntouched()
{
  RoadNetworkAnalyzer analyzer(MakeGrid(3, 100.0));
  analyzer.applyObstructions({Obstruct(2, 4.0)});
  const RoadGraph before = analyzer.snapshotGraph();
  const std::string sig = GraphSignature(before);

  std::string err;
  PathResult p;
  // Mid-edge start and an off-road end: split edge plus access link.
  EXPECT_TRUE(analyzer.findPath(Request(Vec2{50.0, 0.0}, Vec2{170.0, 230.0}, VehicleType::Car), p, err));
  EXPECT_TRUE(p.success);
  EXPECT_EQ(p.startAttach.mode, AttachMode::SplitEdge);
  EXPECT_TRUE(!p.startAttach.accessEdge);
  EXPECT_TRUE(p.endAttach.accessEdge);
  EXPECT_TRUE(p.coords.front() == (Vec2{50.0, 0.0}));
  EXPECT_TRUE(p.coords.back() == (Vec2{170.0, 230.0}));
  for (const int e : p.edges) EXPECT_TRUE(e >= 0 && e < static_cast<int>(before.edges.size()));

  AlternativePathsResult alts;
  EXPECT_TRUE(analyzer.findAlternativePaths(Request(Vec2{50.0, 0.0}, Vec2{200.0, 150.0}, VehicleType::Car), alts, err));

  ServiceAreaResult area;
  EXPECT_TRUE(analyzer.computeServiceArea(Vec2{130.0, 100.0}, DefaultVehicleProfile(VehicleType::Ambulance), 60.0,
                                          area, err));

  // Rejected requests leave no trace either.
  PathResult bad;
  PathRequest badReq = Request(Vec2{50.0, 0.0}, Vec2{100.0, 100.0}, VehicleType::Car);
  badReq.maxTravelTimeSec = -1.0;
  EXPECT_TRUE(!analyzer.findPath(badReq, bad, err));
  EXPECT_TRUE(!err.empty());

  const RoadGraph after = analyzer.snapshotGraph();
  EXPECT_EQ(GraphSignature(after), sig);
  EXPECT_TRUE(ValidateRoadGraph(after, err));
  EXPECT_EQ(analyzer.cleanupIssues(), 0);
  EXPECT_TRUE(analyzer.lastCleanupError().empty());
}

void TestAttachModes()
{
  RoadGraph g = MakeLine(3, 100.0);
  const std::string sig = GraphSignature(g);
  AttachConfig cfg;
  std::string err;

  {
    AttachGuard guard(g);
    AttachInfo snap;
    EXPECT_TRUE(AttachPoint(guard, Vec2{105.0, 0.0}, cfg, snap, err));
    EXPECT_EQ(snap.mode, AttachMode::SnappedToNode);
    EXPECT_EQ(snap.roadNode, 1);
    EXPECT_TRUE(snap.accessEdge); // 5 m from the node itself

    AttachInfo split;
    EXPECT_TRUE(AttachPoint(guard, Vec2{150.0, 0.5}, cfg, split, err));
    EXPECT_EQ(split.mode, AttachMode::SplitEdge);
    EXPECT_EQ(split.edge, 1);
    EXPECT_NEAR(split.ratio, 0.5, 1e-9);
    EXPECT_TRUE(!split.accessEdge);
    EXPECT_TRUE(!g.edges[1].active);
    EXPECT_EQ(g.nodes[static_cast<std::size_t>(split.roadNode)].kind, NodeKind::Virtual);

    AttachInfo forced;
    EXPECT_TRUE(AttachPoint(guard, Vec2{200.0, 900.0}, cfg, forced, err));
    EXPECT_EQ(forced.mode, AttachMode::ForcedConnection);
    EXPECT_EQ(forced.edge, -1);
    EXPECT_EQ(forced.roadNode, 2);
    EXPECT_TRUE(forced.accessEdge);

    EXPECT_TRUE(g.nodes.size() > 3);
  }

  EXPECT_EQ(GraphSignature(g), sig);

  // Explicit rollback is idempotent.
  {
    AttachGuard guard(g);
    AttachInfo info;
    EXPECT_TRUE(AttachPoint(guard, Vec2{40.0, 3.0}, cfg, info, err));
    EXPECT_TRUE(guard.rollback(err));
    EXPECT_TRUE(guard.rollback(err));
  }
  EXPECT_EQ(GraphSignature(g), sig);

  AttachGuard guard(g);
  AttachInfo bad;
  EXPECT_TRUE(!AttachPoint(guard, Vec2{std::numeric_limits<double>::infinity(), 0.0}, cfg, bad, err));
}

void TestFarPointsStillRoute()
{
  RoadNetworkAnalyzer analyzer(MakeGrid(3, 100.0));
  std::string err;

  const Vec2 points[] = {{-500.0, -500.0}, {1000.0, 40.0}, {100.0, 100.0}, {35.0, 160.0}};
  for (const Vec2& a : points) {
    for (const Vec2& b : points) {
      PathResult p;
      EXPECT_TRUE(analyzer.findPath(Request(a, b, VehicleType::Ambulance), p, err));
      EXPECT_TRUE(p.success);
      EXPECT_TRUE(p.coords.front() == a);
      EXPECT_TRUE(p.coords.back() == b);
    }
  }

  PathResult p;
  EXPECT_TRUE(analyzer.findPath(Request(Vec2{-500.0, -500.0}, Vec2{200.0, 200.0}, VehicleType::Ambulance), p, err));
  EXPECT_EQ(p.startAttach.mode, AttachMode::ForcedConnection);
  EXPECT_EQ(p.startAttach.roadNode, 0);
  // 707 m of access link at 5 km/h plus four grid edges.
  EXPECT_TRUE(p.travelTime > 500.0);
}

void TestAStarMatchesDijkstra()
{
  MapSynthConfig cfg;
  cfg.width = 900.0;
  cfg.height = 900.0;
  SynthesizedMap map;
  std::string err;
  EXPECT_TRUE(SynthesizeRoadMap(cfg, 7u, map, err));
  const RoadGraph& g = map.graph;
  const int n = static_cast<int>(g.nodes.size());
  EXPECT_TRUE(n > 10);
  if (n <= 10) return;

  const VehicleProfile amb = DefaultVehicleProfile(VehicleType::Ambulance);
  const EdgeCostFn cost = [&](int ei, int) { return EdgeTraversalCost(g.edges[static_cast<std::size_t>(ei)], amb); };

  AStarConfig acfg;
  acfg.maxExpansions = 1000000;
  for (const RoadGraphEdge& e : g.edges) {
    if (e.active) acfg.heuristicSpeed = std::max(acfg.heuristicSpeed, EdgeSpeedMps(e, amb));
  }

  for (int src = 0; src < n; src += std::max(1, n / 5)) {
    const ShortestPathTree tree = RunDijkstra(g, src, cost);
    for (int dst = n - 1; dst >= 0; dst -= std::max(1, n / 7)) {
      const AStarResult ar = FindRouteAStar(g, src, dst, cost, acfg);
      const double d = tree.dist[static_cast<std::size_t>(dst)];
      if (std::isfinite(d)) {
        EXPECT_EQ(ar.status, SearchStatus::Found);
        EXPECT_NEAR(ar.route.cost, d, 1e-6);

        double sum = 0.0;
        for (std::size_t i = 0; i < ar.route.edges.size(); ++i) {
          sum += cost(ar.route.edges[i], ar.route.nodes[i]);
        }
        EXPECT_NEAR(sum, d, 1e-6);
      } else {
        EXPECT_EQ(ar.status, SearchStatus::NoPath);
      }
    }
  }
}

void TestPartialPathLimits()
{
  AnalyzerConfig cfg;
  RoadNetworkAnalyzer analyzer(MakeLine(6, 100.0), cfg);
  std::string err;

  // 12 s per edge; only two edges fit in 30 s.
  PathRequest req = Request(Vec2{0.0, 0.0}, Vec2{500.0, 0.0}, VehicleType::Ambulance);
  req.maxTravelTimeSec = 30.0;
  PathResult p;
  EXPECT_TRUE(analyzer.findPath(req, p, err));
  EXPECT_TRUE(!p.success);
  EXPECT_TRUE(p.isPartial);
  EXPECT_EQ(p.reason, PathReason::TimeLimitExceeded);
  EXPECT_EQ(p.coords.size(), static_cast<std::size_t>(3));
  if (p.coords.size() == 3) EXPECT_TRUE(p.coords.back() == (Vec2{200.0, 0.0}));
  EXPECT_EQ(p.edges.size(), static_cast<std::size_t>(2));
  EXPECT_NEAR(p.travelTime, 24.0, 1e-9);

  AnalyzerConfig tight;
  tight.maxExpansions = 1;
  RoadNetworkAnalyzer limited(MakeLine(6, 100.0), tight);
  PathResult q;
  EXPECT_TRUE(limited.findPath(Request(Vec2{0.0, 0.0}, Vec2{500.0, 0.0}, VehicleType::Ambulance), q, err));
  EXPECT_TRUE(!q.success);
  EXPECT_EQ(q.reason, PathReason::ExpansionLimit);
  // The fallback search is not bound by the A* expansion budget.
  EXPECT_TRUE(q.coords.back() == (Vec2{500.0, 0.0}));

  EXPECT_EQ(std::string(ToString(PathReason::TimeLimitExceeded)), std::string("time_limit_exceeded"));
}

void TestAlternativePathsAreDistinct()
{
  RoadGraph g;
  const int s = AddRoadNode(g, Vec2{0.0, 0.0});
  const int a = AddRoadNode(g, Vec2{100.0, 10.0});
  const int b = AddRoadNode(g, Vec2{100.0, -40.0});
  const int t = AddRoadNode(g, Vec2{200.0, 0.0});
  const int sa = AddRoadEdge(g, s, a, Secondary());
  const int at = AddRoadEdge(g, a, t, Secondary());
  const int sb = AddRoadEdge(g, s, b, Secondary());
  const int bt = AddRoadEdge(g, b, t, Secondary());

  RoadNetworkAnalyzer analyzer(g);
  AlternativePathsResult r;
  std::string err;
  EXPECT_TRUE(analyzer.findAlternativePaths(Request(Vec2{0.0, 0.0}, Vec2{200.0, 0.0}, VehicleType::Car), r, err));

  // Third attempt repeats the first route and ends the search.
  EXPECT_EQ(r.paths.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(r.attempts, 3);
  if (r.paths.size() != 2) return;

  EXPECT_EQ(r.paths[0].edges, (std::vector<int>{sa, at}));
  EXPECT_EQ(r.paths[1].edges, (std::vector<int>{sb, bt}));
  EXPECT_TRUE(r.paths[0].travelTime < r.paths[1].travelTime);
  for (const PathResult& p : r.paths) EXPECT_TRUE(p.success);

  AnalyzerConfig one;
  one.maxAlternativePaths = 1;
  RoadNetworkAnalyzer single(g, one);
  EXPECT_TRUE(single.findAlternativePaths(Request(Vec2{0.0, 0.0}, Vec2{200.0, 0.0}, VehicleType::Car), r, err));
  EXPECT_EQ(r.paths.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(r.attempts, 1);
}

void TestAlternativesIgnoreSharedAccessLinks()
{
  // Both query points sit 5 m off dead-end stubs, so every candidate starts and ends on
  // the same access links and split halves.
  RoadGraph g;
  const int w = AddRoadNode(g, Vec2{-100.0, 0.0});
  const int s = AddRoadNode(g, Vec2{0.0, 0.0});
  const int a = AddRoadNode(g, Vec2{100.0, 10.0});
  const int b = AddRoadNode(g, Vec2{100.0, -40.0});
  const int t = AddRoadNode(g, Vec2{200.0, 0.0});
  const int e = AddRoadNode(g, Vec2{300.0, 0.0});
  const int ws = AddRoadEdge(g, w, s, Secondary());
  const int sa = AddRoadEdge(g, s, a, Secondary());
  const int at = AddRoadEdge(g, a, t, Secondary());
  const int sb = AddRoadEdge(g, s, b, Secondary());
  const int bt = AddRoadEdge(g, b, t, Secondary());
  const int te = AddRoadEdge(g, t, e, Secondary());

  AnalyzerConfig cfg;
  cfg.maxOverlapFraction = 0.6;
  RoadNetworkAnalyzer analyzer(g, cfg);
  AlternativePathsResult r;
  std::string err;
  EXPECT_TRUE(analyzer.findAlternativePaths(Request(Vec2{-50.0, 5.0}, Vec2{250.0, 5.0}, VehicleType::Car), r, err));

  // Road-level overlap is 2 of 4, below the limit.
  EXPECT_EQ(r.paths.size(), static_cast<std::size_t>(2));
  if (r.paths.size() != 2) return;
  EXPECT_EQ(r.paths[0].edges, (std::vector<int>{ws, sa, at, te}));
  EXPECT_EQ(r.paths[1].edges, (std::vector<int>{ws, sb, bt, te}));
  EXPECT_TRUE(r.paths[0].startAttach.mode == AttachMode::SplitEdge);
  EXPECT_TRUE(r.paths[0].startAttach.accessEdge);
  EXPECT_TRUE(r.paths[1].endAttach.accessEdge);
}

void TestIsochronesNest()
{
  RoadNetworkAnalyzer analyzer(MakeGrid(5, 100.0));
  ServiceAreaRequest req;
  req.center = Vec2{200.0, 200.0};
  req.vehicle = DefaultVehicleProfile(VehicleType::Ambulance);
  req.thresholdsSec = {60.0, 30.0, 120.0};

  ServiceAreaResult r;
  std::string err;
  EXPECT_TRUE(analyzer.computeIsochrones(req, r, err));
  EXPECT_EQ(r.bands.size(), static_cast<std::size_t>(3));
  if (r.bands.size() != 3) return;

  EXPECT_NEAR(r.bands[0].thresholdSec, 30.0, 1e-12);
  EXPECT_NEAR(r.bands[2].thresholdSec, 120.0, 1e-12);

  // 12 s per edge: 2, 5 and 10 hops.
  EXPECT_EQ(r.bands[0].nodeCount, 13);
  EXPECT_EQ(r.bands[2].nodeCount, 25);
  for (std::size_t i = 1; i < r.bands.size(); ++i) {
    EXPECT_TRUE(r.bands[i].nodeCount >= r.bands[i - 1].nodeCount);
    EXPECT_TRUE(r.bands[i].areaM2 + 1e-9 >= r.bands[i - 1].areaM2);
    EXPECT_TRUE(r.bands[i].maxReachedSec <= r.bands[i].thresholdSec);
  }
  EXPECT_NEAR(r.bands[2].areaM2, 160000.0, 1e-6);

  req.thresholdsSec = {0.0};
  EXPECT_TRUE(!analyzer.computeIsochrones(req, r, err));

  const std::vector<double> thr = IsochroneThresholds(900.0, 300.0);
  EXPECT_EQ(thr, (std::vector<double>{300.0, 600.0, 900.0}));
}

void TestConnectivityFragmentation()
{
  RoadGraph g;
  for (const Vec2 p : {Vec2{0.0, 0.0}, Vec2{100.0, 0.0}, Vec2{50.0, 80.0}, Vec2{300.0, 0.0}, Vec2{400.0, 0.0},
                       Vec2{350.0, 80.0}}) {
    AddRoadNode(g, p);
  }
  AddRoadEdge(g, 0, 1, Secondary());
  AddRoadEdge(g, 1, 2, Secondary());
  AddRoadEdge(g, 2, 0, Secondary());
  AddRoadEdge(g, 3, 4, Secondary());
  AddRoadEdge(g, 4, 5, Secondary());
  AddRoadEdge(g, 5, 3, Secondary());
  const int bridge = AddRoadEdge(g, 1, 3, Secondary());

  RoadNetworkAnalyzer analyzer(g);
  ConnectivityReport r;
  std::string err;
  EXPECT_TRUE(analyzer.analyzeConnectivity(DefaultVehicleProfile(VehicleType::Ambulance), r, err));
  EXPECT_EQ(r.components, 1);
  EXPECT_TRUE(!r.fragmented);
  EXPECT_EQ(r.totalEdges, 7);
  EXPECT_EQ(r.bridgeEdges, (std::vector<int>{bridge}));

  analyzer.applyObstructions({Obstruct(bridge, 1.0)});
  EXPECT_TRUE(analyzer.analyzeConnectivity(DefaultVehicleProfile(VehicleType::Ambulance), r, err));
  EXPECT_TRUE(r.fragmented);
  EXPECT_EQ(r.components, 2);
  EXPECT_EQ(r.blockedEdges, 1);
  EXPECT_EQ(r.blockedEdgeIds, (std::vector<int>{bridge}));
  EXPECT_EQ(r.severelyObstructed, 1);
  EXPECT_EQ(r.largestComponentEdges, 3);
  EXPECT_TRUE(r.bridgeEdges.empty());

  // Still wide enough on foot.
  EXPECT_TRUE(analyzer.analyzeConnectivity(DefaultVehicleProfile(VehicleType::Pedestrian), r, err));
  EXPECT_TRUE(!r.fragmented);
  EXPECT_EQ(r.blockedEdges, 0);

  std::vector<std::uint8_t> mask(g.edges.size(), 1);
  const RoadGraphConnectivityResult cr = ComputeRoadGraphConnectivity(g, mask);
  EXPECT_EQ(cr.componentsWithEdges, 1);
  EXPECT_EQ(cr.isBridgeEdge[static_cast<std::size_t>(bridge)], 1);
}

void TestCoverageClassification()
{
  CoverageConfig cfg;
  EXPECT_EQ(ClassifyResponseTime(0.0, cfg), CoverageLevel::Excellent);
  EXPECT_EQ(ClassifyResponseTime(300.0, cfg), CoverageLevel::Excellent);
  EXPECT_EQ(ClassifyResponseTime(300.5, cfg), CoverageLevel::Good);
  EXPECT_EQ(ClassifyResponseTime(600.0, cfg), CoverageLevel::Good);
  EXPECT_EQ(ClassifyResponseTime(900.0, cfg), CoverageLevel::Fair);
  EXPECT_EQ(ClassifyResponseTime(1800.0, cfg), CoverageLevel::Poor);
  EXPECT_EQ(ClassifyResponseTime(1800.5, cfg), CoverageLevel::Unreachable);
  EXPECT_EQ(ClassifyResponseTime(std::numeric_limits<double>::infinity(), cfg), CoverageLevel::Unreachable);

  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_EQ(ClassifyCoverageChange(100.0, inf), CoverageChange::NewlyUnreachable);
  EXPECT_EQ(ClassifyCoverageChange(inf, 100.0), CoverageChange::NewlyReachable);
  EXPECT_EQ(ClassifyCoverageChange(inf, inf), CoverageChange::StillUnreachable);
  EXPECT_EQ(ClassifyCoverageChange(100.0, 151.0), CoverageChange::SeverelyDegraded);
  EXPECT_EQ(ClassifyCoverageChange(100.0, 150.0), CoverageChange::ModeratelyDegraded);
  EXPECT_EQ(ClassifyCoverageChange(100.0, 121.0), CoverageChange::ModeratelyDegraded);
  EXPECT_EQ(ClassifyCoverageChange(100.0, 110.0), CoverageChange::SlightlyDegraded);
  EXPECT_EQ(ClassifyCoverageChange(100.0, 90.0), CoverageChange::Improved);
  EXPECT_EQ(ClassifyCoverageChange(100.0, 100.0), CoverageChange::Unchanged);

  int cols = 0;
  int rows = 0;
  const std::vector<CoverageCell> cells = BuildCoverageGrid(MapBounds{0.0, 0.0, 250.0, 120.0}, 100.0, cols, rows);
  EXPECT_EQ(cols, 3);
  EXPECT_EQ(rows, 2);
  EXPECT_EQ(cells.size(), static_cast<std::size_t>(6));
  // Last column and row are clamped inside the map.
  EXPECT_NEAR(cells[2].center.x, 200.0, 1e-9);
  EXPECT_NEAR(cells[5].center.y, 70.0, 1e-9);
}

void TestCoverageBeforeAndAfter()
{
  // Cell centers coincide with the grid nodes.
  RoadNetworkAnalyzer analyzer(MakeGrid(3, 100.0, Vec2{50.0, 50.0}));
  const MapBounds bounds{0.0, 0.0, 300.0, 300.0};
  const std::vector<Vec2> stations{Vec2{150.0, 150.0}};
  CoverageConfig cfg;

  CoverageReport before;
  std::string err;
  EXPECT_TRUE(AnalyzeServiceCoverage(analyzer, bounds, stations, cfg, before, err));
  EXPECT_EQ(before.stats.cells, 9);
  EXPECT_EQ(before.stats.reachable, 9);
  EXPECT_NEAR(before.stats.coveragePct, 100.0, 1e-9);
  EXPECT_EQ(before.stats.byLevel[static_cast<std::size_t>(CoverageLevel::Excellent)], 9);
  // Corners are two edges away.
  EXPECT_NEAR(before.stats.maxResponseSec, 24.0, 1e-9);
  EXPECT_NEAR(before.stats.totalAreaKm2, 0.09, 1e-12);

  std::vector<RoadObstruction> closeAll;
  const RoadGraph g = analyzer.snapshotGraph();
  for (int ei = 0; ei < static_cast<int>(g.edges.size()); ++ei) closeAll.push_back(Obstruct(ei, 0.0));
  analyzer.applyObstructions(closeAll);

  CoverageReport after;
  EXPECT_TRUE(AnalyzeServiceCoverage(analyzer, bounds, stations, cfg, after, err));
  EXPECT_EQ(after.stats.reachable, 1);
  EXPECT_NEAR(after.stats.blindAreaKm2, 0.08, 1e-12);

  CoverageComparison cmp;
  EXPECT_TRUE(CompareCoverage(before, after, cmp, err));
  EXPECT_EQ(cmp.counts[static_cast<std::size_t>(CoverageChange::NewlyUnreachable)], 8);
  EXPECT_EQ(cmp.counts[static_cast<std::size_t>(CoverageChange::Unchanged)], 1);
  EXPECT_EQ(cmp.degradedCells, 0);
  EXPECT_NEAR(cmp.coverageChangePct, 100.0 / 9.0 - 100.0, 1e-9);

  CoverageReport other = after;
  other.cols = 4;
  EXPECT_TRUE(!CompareCoverage(before, other, cmp, err));

  EXPECT_TRUE(!AnalyzeServiceCoverage(analyzer, bounds, {}, cfg, after, err));
}

void TestJsonParseAndWrite()
{
  JsonValue v;
  std::string err;
  EXPECT_TRUE(ParseJson("{\"a\": [1, 2.5, true, null], \"b\": \"x\\u00e9\"}", v, err));
  EXPECT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  EXPECT_TRUE(a && a->isArray() && a->arrayValue.size() == 4);
  const JsonValue* b = FindJsonMember(v, "b");
  EXPECT_TRUE(b && b->stringValue == "x\xc3\xa9");

  EXPECT_TRUE(!ParseJson("{\n  \"a\": 1,\n}", v, err));
  EXPECT_TRUE(err.find("line 3") != std::string::npos);

  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(oss, opt);
  EXPECT_TRUE(w.beginObject() && w.member("n", 3) && w.member("s", "q\"") && w.key("arr") && w.beginArray() &&
              w.numberValue(0.5) && w.endArray() && w.endObject());
  EXPECT_TRUE(w.finished());
  EXPECT_EQ(oss.str(), std::string("{\"n\":3,\"s\":\"q\\\"\",\"arr\":[0.5]}"));

  std::ostringstream bad;
  JsonWriter w2(bad);
  EXPECT_TRUE(w2.beginObject());
  EXPECT_TRUE(!w2.numberValue(1.0)); // key expected
  EXPECT_TRUE(!w2.ok());

  EXPECT_EQ(JsonEscape(std::string("a\tb\x01")), std::string("a\\tb\\u0001"));
}

void TestCombinedConfigMerge()
{
  CombinedConfig cfg;
  JsonValue root;
  std::string err;
  EXPECT_TRUE(ParseJson("{\"map\":{\"main_road_count\":6},\"coverage\":{\"vehicle\":\"fire_truck\"},"
                        "\"disaster\":{\"base_rates\":[0.9,0.4,0.2]}}",
                        root, err));
  EXPECT_TRUE(ApplyCombinedConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.map.mainRoadCount, 6);
  EXPECT_NEAR(cfg.map.width, 2000.0, 1e-12); // untouched
  EXPECT_EQ(cfg.coverage.vehicle, VehicleType::FireTruck);
  EXPECT_NEAR(cfg.disaster.baseRates[0], 0.9, 1e-12);
  EXPECT_TRUE(cfg.hasMap && cfg.hasCoverage && cfg.hasDisaster);
  EXPECT_TRUE(!cfg.hasTrees);

  EXPECT_TRUE(ParseJson("{\"map\":{\"main_road_count\":2.5}}", root, err));
  EXPECT_TRUE(!ApplyCombinedConfigJson(root, cfg, err));
  EXPECT_EQ(err, std::string("map: expected integer for key 'main_road_count'"));

  EXPECT_TRUE(ParseJson("{\"coverage\":{\"vehicle\":\"bus\"}}", root, err));
  EXPECT_TRUE(!ApplyCombinedConfigJson(root, cfg, err));

  // Written configs load back to the same values.
  cfg.analyzer.maxAlternativePaths = 5;
  const std::string text = CombinedConfigToJson(cfg);
  CombinedConfig reread;
  EXPECT_TRUE(ParseJson(text, root, err));
  EXPECT_TRUE(ApplyCombinedConfigJson(root, reread, err));
  EXPECT_EQ(reread.map.mainRoadCount, 6);
  EXPECT_EQ(reread.analyzer.maxAlternativePaths, 5);
  EXPECT_EQ(reread.coverage.vehicle, VehicleType::FireTruck);
}

void TestTreeAndObstructionFiles()
{
  JsonValue root;
  std::string err;
  EXPECT_TRUE(ParseJson("{\"trees\":[{\"x\":1,\"y\":2,\"level\":\"II\",\"height\":9,\"trunk_width\":0.4},"
                        "{\"id\":7,\"x\":3,\"y\":4,\"level\":1,\"height\":12,\"trunk_width\":0.9}]}",
                        root, err));
  std::vector<Tree> trees;
  EXPECT_TRUE(ParseTreesJson(root, trees, err));
  EXPECT_EQ(trees.size(), static_cast<std::size_t>(2));
  if (trees.size() == 2) {
    EXPECT_EQ(trees[0].id, 0);
    EXPECT_EQ(trees[0].level, VulnerabilityLevel::II);
    EXPECT_EQ(trees[1].id, 7);
    EXPECT_EQ(trees[1].level, VulnerabilityLevel::I);
  }

  EXPECT_TRUE(ParseJson("{\"trees\":[{\"x\":1,\"y\":2,\"height\":9,\"trunk_width\":0.4}]}", root, err));
  EXPECT_TRUE(!ParseTreesJson(root, trees, err));
  EXPECT_TRUE(err.find("trees[0]") != std::string::npos);

  EXPECT_TRUE(ParseJson("{\"obstructions\":[{\"remaining_width\":2}]}", root, err));
  std::vector<RoadObstruction> obs;
  EXPECT_TRUE(!ParseObstructionsJson(root, obs, err));

  const fs::path dir = fs::temp_directory_path() / "urbanres_tests_io";
  std::error_code ec;
  fs::create_directories(dir, ec);
  const std::string path = (dir / "obstructions.json").string();

  std::vector<RoadObstruction> src{Obstruct(3, 1.5), Obstruct(4, 0.0)};
  src[0].hasDirectional = true;
  src[0].forwardRemaining = 1.5;
  src[0].backwardRemaining = 3.0;
  src[0].forwardAffected = true;
  EXPECT_TRUE(WriteObstructionsJsonFile(path, src, err));
  EXPECT_TRUE(LoadObstructionsJsonFile(path, obs, err));
  EXPECT_EQ(obs.size(), static_cast<std::size_t>(2));
  if (obs.size() == 2) {
    EXPECT_EQ(obs[0].edge, 3);
    EXPECT_NEAR(obs[0].remainingWidth, 1.5, 1e-12);
    EXPECT_TRUE(obs[0].hasDirectional && obs[0].forwardAffected);
    EXPECT_EQ(obs[1].edge, 4);
  }

  EXPECT_TRUE(!LoadTreesJsonFile((dir / "missing.json").string(), trees, err));
  fs::remove_all(dir, ec);
}

} // namespace

int main()
{
  TestVehicleProfilesAndWidthPenalty();
  TestLaneLayout();
  TestMainRoadsShareCrossingNodes();
  TestSameSeedSameWorld();
  TestRoadsideTreePlacement();
  TestFacilitiesNeedEnoughNodes();

  TestCollapseProbability();
  TestBlockageUsesNarrowestCrossSection();
  TestDirectionalBlockage();
  TestDegenerateEdgeUsesFixedBlockage();
  TestSimulateTreeCollapse();

  TestNarrowedRoadBlocksCars();
  TestObstructionResetAndMinimum();
  TestQueriesLeaveGraphUntouched();
  TestAttachModes();
  TestFarPointsStillRoute();
  TestAStarMatchesDijkstra();
  TestPartialPathLimits();
  TestAlternativePathsAreDistinct();
  TestAlternativesIgnoreSharedAccessLinks();
  TestIsochronesNest();
  TestConnectivityFragmentation();

  TestCoverageClassification();
  TestCoverageBeforeAndAfter();

  TestJsonParseAndWrite();
  TestCombinedConfigMerge();
  TestTreeAndObstructionFiles();

  if (g_failures == 0) {
    std::cout << "urbanres_tests: OK\n";
    return 0;
  }

  std::cerr << "urbanres_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
