#include "urbanres/Export.hpp"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <utility>

namespace urbanres {

namespace {

bool WritePoint(JsonWriter& w, Vec2 p)
{
  return w.beginArray() && w.numberValue(p.x) && w.numberValue(p.y) && w.endArray();
}

bool WritePoints(JsonWriter& w, const std::vector<Vec2>& pts)
{
  if (!w.beginArray()) return false;
  for (const Vec2& p : pts) {
    if (!WritePoint(w, p)) return false;
  }
  return w.endArray();
}

bool WriteIntArray(JsonWriter& w, const std::vector<int>& v)
{
  if (!w.beginArray()) return false;
  for (const int i : v) {
    if (!w.intValue(i)) return false;
  }
  return w.endArray();
}

// Non-finite times (unreachable) are written as null.
bool WriteSeconds(JsonWriter& w, double s)
{
  return std::isfinite(s) ? w.numberValue(s) : w.nullValue();
}

bool WriteAttachJson(JsonWriter& w, const AttachInfo& a)
{
  return w.beginObject() && w.member("mode", ToString(a.mode)) && w.member("node", a.node) &&
         w.member("road_node", a.roadNode) && w.member("edge", a.edge) && w.member("ratio", a.ratio) &&
         w.key("road_point") && WritePoint(w, a.roadPoint) && w.member("distance", a.distance) &&
         w.member("access_edge", a.accessEdge) && w.endObject();
}

bool WriteMapStatsJson(JsonWriter& w, const SynthesizedMap& map)
{
  int virtualNodes = 0;
  for (const RoadGraphNode& n : map.graph.nodes) {
    if (n.kind != NodeKind::Intersection) ++virtualNodes;
  }
  return w.beginObject() && w.member("main_roads", map.mainRoads) &&
         w.member("diagonal_roads", map.diagonalRoads) && w.member("alleys", map.alleys) &&
         w.member("nodes", static_cast<int>(map.graph.nodes.size())) &&
         w.member("edges", CountActiveEdges(map.graph)) && w.member("transient_nodes", virtualNodes) &&
         w.member("segments_in", map.intersections.segmentsIn) &&
         w.member("segments_skipped", map.intersections.segmentsSkipped) &&
         w.member("crossings", map.intersections.crossings) &&
         w.member("split_nodes", map.intersections.splitNodes) && w.endObject();
}

template <typename Fn>
bool WriteDocumentFile(const std::string& path, Fn&& body, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }

  JsonWriter w(f);
  if (!body(w) || !w.finished()) {
    outError = w.ok() ? ("incomplete JSON document: " + path) : w.error();
    return false;
  }
  f << '\n';
  f.close();
  if (!f) {
    outError = "failed to write: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool GetNumber(const JsonValue& obj, const char* key, double& out, bool required, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) {
    if (required) err = std::string("missing key '") + key + "'";
    return !required;
  }
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected finite number for key '") + key + "'";
    return false;
  }
  out = v->numberValue;
  return true;
}

bool GetInt(const JsonValue& obj, const char* key, int& out, bool required, std::string& err)
{
  double d = static_cast<double>(out);
  if (!GetNumber(obj, key, d, required, err)) return false;
  if (d != std::floor(d)) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  out = static_cast<int>(d);
  return true;
}

bool GetBool(const JsonValue& obj, const char* key, bool& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  out = v->boolValue;
  return true;
}

bool GetPolygon(const JsonValue& obj, const char* key, Polygon& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isArray()) {
    err = std::string("expected array of [x,y] points for key '") + key + "'";
    return false;
  }
  out.clear();
  for (const JsonValue& p : v->arrayValue) {
    if (!p.isArray() || p.arrayValue.size() != 2 || !p.arrayValue[0].isNumber() || !p.arrayValue[1].isNumber()) {
      err = std::string("malformed point in '") + key + "'";
      return false;
    }
    out.push_back(Vec2{p.arrayValue[0].numberValue, p.arrayValue[1].numberValue});
  }
  return true;
}

const JsonValue* FindArraySection(const JsonValue& root, const char* key, std::string& err)
{
  if (!root.isObject()) {
    err = "expected a JSON object at the top level";
    return nullptr;
  }
  const JsonValue* arr = FindJsonMember(root, key);
  if (!arr || !arr->isArray()) {
    err = std::string("expected array '") + key + "'";
    return nullptr;
  }
  return arr;
}

} // namespace

bool WriteRoadGraphJson(JsonWriter& w, const RoadGraph& g)
{
  if (!w.beginObject() || !w.key("nodes") || !w.beginArray()) return false;
  for (std::size_t i = 0; i < g.nodes.size(); ++i) {
    const RoadGraphNode& n = g.nodes[i];
    if (!w.beginObject() || !w.member("id", static_cast<int>(i)) || !w.member("x", n.pos.x) ||
        !w.member("y", n.pos.y) || !w.member("kind", ToString(n.kind)) || !w.member("degree", static_cast<int>(n.edges.size())) ||
        !w.endObject()) {
      return false;
    }
  }
  if (!w.endArray() || !w.key("edges") || !w.beginArray()) return false;

  for (std::size_t i = 0; i < g.edges.size(); ++i) {
    const RoadGraphEdge& e = g.edges[i];
    if (!e.active) continue;
    if (!w.beginObject() || !w.member("id", static_cast<int>(i)) || !w.member("a", e.a) || !w.member("b", e.b) ||
        !w.member("class", ToString(e.roadClass)) || !w.member("lanes", e.laneCount) ||
        !w.member("bidirectional", e.bidirectional) || !w.member("speed_limit_kmh", e.speedLimitKmh) ||
        !w.member("length", e.length) || !w.member("original_width", e.originalWidth) ||
        !w.member("current_width", e.currentWidth) || !w.member("direction", ToString(e.direction))) {
      return false;
    }
    if (!w.key("lane_info") || !w.beginArray()) return false;
    for (const LaneInfo& l : e.lanes) {
      if (!w.beginObject() || !w.member("index", l.index) || !w.member("direction", ToString(l.direction)) ||
          !w.member("side", ToString(l.side)) || !w.member("width", l.width) || !w.endObject()) {
        return false;
      }
    }
    if (!w.endArray() || !w.endObject()) return false;
  }
  return w.endArray() && w.endObject();
}

bool WriteTreesJson(JsonWriter& w, const std::vector<Tree>& trees)
{
  if (!w.beginArray()) return false;
  for (const Tree& t : trees) {
    if (!w.beginObject() || !w.member("id", t.id) || !w.member("x", t.pos.x) || !w.member("y", t.pos.y) ||
        !w.member("level", ToString(t.level)) || !w.member("height", t.height) ||
        !w.member("trunk_width", t.trunkWidth) || !w.endObject()) {
      return false;
    }
  }
  return w.endArray();
}

bool WriteFacilitiesJson(JsonWriter& w, const std::vector<Facility>& facilities)
{
  if (!w.beginArray()) return false;
  for (const Facility& f : facilities) {
    if (!w.beginObject() || !w.member("id", f.id) || !w.member("type", ToString(f.type)) ||
        !w.member("name", f.name) || !w.member("node", f.node) || !w.member("x", f.pos.x) ||
        !w.member("y", f.pos.y)) {
      return false;
    }
    if (f.type == FacilityType::Shelter && !w.member("capacity", f.capacity)) return false;
    if (!w.endObject()) return false;
  }
  return w.endArray();
}

bool WriteObstructionsJson(JsonWriter& w, const std::vector<RoadObstruction>& obstructions)
{
  if (!w.beginArray()) return false;
  for (const RoadObstruction& o : obstructions) {
    if (!w.beginObject() || !w.member("id", o.id) || !w.member("edge", o.edge) || !w.member("event_id", o.eventId) ||
        !w.member("remaining_width", o.remainingWidth) || !w.member("blocked_percentage", o.blockedPercentage) ||
        !w.member("blocked_length", o.blockedLength) || !w.member("approximate", o.approximate) ||
        !w.key("polygon") || !WritePoints(w, o.polygon)) {
      return false;
    }
    if (o.hasDirectional) {
      if (!w.key("directional") || !w.beginObject() || !w.member("forward_remaining", o.forwardRemaining) ||
          !w.member("backward_remaining", o.backwardRemaining) ||
          !w.member("forward_affected", o.forwardAffected) ||
          !w.member("backward_affected", o.backwardAffected) || !w.endObject()) {
        return false;
      }
    }
    if (!w.endObject()) return false;
  }
  return w.endArray();
}

bool WriteDisasterJson(JsonWriter& w, const DisasterResult& r, const DisasterConfig& cfg)
{
  const DisasterStats& s = r.stats;
  if (!w.beginObject() || !w.key("seed") || !w.uintValue(r.seed) || !w.member("intensity", cfg.intensity)) return false;

  if (!w.key("stats") || !w.beginObject() || !w.member("trees_evaluated", s.treesEvaluated) ||
      !w.member("trees_skipped", s.treesSkipped) || !w.member("collapsed", s.collapsed) ||
      !w.key("collapsed_by_level") || !w.beginObject()) {
    return false;
  }
  for (int i = 0; i < kVulnerabilityLevelCount; ++i) {
    if (!w.member(ToString(static_cast<VulnerabilityLevel>(i)), s.collapsedByLevel[static_cast<std::size_t>(i)])) {
      return false;
    }
  }
  if (!w.endObject() || !w.member("obstructions", s.obstructions) || !w.member("roads_affected", s.roadsAffected) ||
      !w.member("approximate_obstructions", s.approximateObstructions) ||
      !w.member("total_blocked_length", s.totalBlockedLength) ||
      !w.member("average_blockage_pct", s.averageBlockagePct) || !w.endObject()) {
    return false;
  }

  if (!w.key("events") || !w.beginArray()) return false;
  for (const TreeCollapseEvent& ev : r.events) {
    if (!w.beginObject() || !w.member("id", ev.id) || !w.member("tree_id", ev.treeId) ||
        !w.member("x", ev.location.x) || !w.member("y", ev.location.y) || !w.member("level", ToString(ev.level)) ||
        !w.member("angle_deg", ev.angleDeg) || !w.member("height", ev.height) ||
        !w.member("trunk_width", ev.trunkWidth) || !w.member("severity", ev.severity) || !w.key("polygon") ||
        !WritePoints(w, ev.blockage) || !w.endObject()) {
      return false;
    }
  }
  if (!w.endArray()) return false;

  return w.key("obstructions") && WriteObstructionsJson(w, r.obstructions) && w.endObject();
}

bool WritePathJson(JsonWriter& w, const PathResult& p)
{
  if (!w.beginObject() || !w.member("success", p.success) || !w.member("is_partial", p.isPartial) ||
      !w.member("reason", ToString(p.reason)) || !w.member("distance", p.distance) ||
      !w.member("travel_time", p.travelTime) || !w.member("expansions", p.expansions) || !w.key("edges") ||
      !WriteIntArray(w, p.edges) || !w.key("coords") || !WritePoints(w, p.coords)) {
    return false;
  }

  if (!w.key("blocked_roads") || !w.beginArray()) return false;
  for (const BlockedRoad& b : p.blockedRoads) {
    if (!w.beginObject() || !w.member("edge", b.edge) || !w.member("current_width", b.currentWidth) ||
        !w.member("original_width", b.originalWidth) || !w.endObject()) {
      return false;
    }
  }
  if (!w.endArray()) return false;

  return w.key("start_attach") && WriteAttachJson(w, p.startAttach) && w.key("end_attach") &&
         WriteAttachJson(w, p.endAttach) && w.endObject();
}

bool WriteServiceAreaJson(JsonWriter& w, const ServiceAreaResult& r)
{
  if (!w.beginObject() || !w.key("center") || !WritePoint(w, r.center) || !w.key("center_attach") ||
      !WriteAttachJson(w, r.centerAttach) || !w.key("bands") || !w.beginArray()) {
    return false;
  }
  for (const IsochroneBand& b : r.bands) {
    if (!w.beginObject() || !w.member("threshold_sec", b.thresholdSec) || !w.member("nodes", b.nodeCount) ||
        !w.member("area_m2", b.areaM2) || !w.member("max_reached_sec", b.maxReachedSec) || !w.key("hull") ||
        !WritePoints(w, b.hull) || !w.endObject()) {
      return false;
    }
  }
  return w.endArray() && w.endObject();
}

bool WriteConnectivityJson(JsonWriter& w, const ConnectivityReport& r)
{
  return w.beginObject() && w.member("total_edges", r.totalEdges) && w.member("passable_edges", r.passableEdges) &&
         w.member("blocked_edges", r.blockedEdges) && w.member("total_length", r.totalLength) &&
         w.member("passable_length", r.passableLength) && w.member("blocked_length", r.blockedLength) &&
         w.member("severely_obstructed", r.severelyObstructed) && w.member("components", r.components) &&
         w.member("largest_component_nodes", r.largestComponentNodes) &&
         w.member("largest_component_edges", r.largestComponentEdges) && w.member("fragmented", r.fragmented) &&
         w.key("blocked_edge_ids") && WriteIntArray(w, r.blockedEdgeIds) && w.key("bridge_edges") &&
         WriteIntArray(w, r.bridgeEdges) && w.endObject();
}

bool WriteCoverageJson(JsonWriter& w, const CoverageReport& r, bool includeCells)
{
  const CoverageStats& s = r.stats;
  if (!w.beginObject() || !w.member("cell_size", r.cellSize) || !w.member("cols", r.cols) ||
      !w.member("rows", r.rows) || !w.member("stations", r.stations) || !w.key("stats") || !w.beginObject() ||
      !w.member("cells", s.cells) || !w.member("reachable", s.reachable) ||
      !w.member("coverage_pct", s.coveragePct) || !w.member("avg_response_sec", s.avgResponseSec) ||
      !w.member("median_response_sec", s.medianResponseSec) || !w.member("max_response_sec", s.maxResponseSec) ||
      !w.member("blind_area_km2", s.blindAreaKm2) || !w.member("total_area_km2", s.totalAreaKm2) ||
      !w.key("by_level") || !w.beginObject()) {
    return false;
  }
  for (int i = 0; i < kCoverageLevelCount; ++i) {
    if (!w.member(ToString(static_cast<CoverageLevel>(i)), s.byLevel[static_cast<std::size_t>(i)])) return false;
  }
  if (!w.endObject() || !w.endObject()) return false;

  if (includeCells) {
    if (!w.key("cells") || !w.beginArray()) return false;
    for (const CoverageCell& c : r.cells) {
      if (!w.beginObject() || !w.member("col", c.col) || !w.member("row", c.row) || !w.member("x", c.center.x) ||
          !w.member("y", c.center.y) || !w.key("response_sec") || !WriteSeconds(w, c.responseSec) ||
          !w.member("station", c.station) || !w.member("level", ToString(c.level)) || !w.endObject()) {
        return false;
      }
    }
    if (!w.endArray()) return false;
  }
  return w.endObject();
}

bool WriteCoverageComparisonJson(JsonWriter& w, const CoverageComparison& c, const CoverageReport& after)
{
  if (!w.beginObject() || !w.member("coverage_change_pct", c.coverageChangePct) ||
      !w.member("degraded_cells", c.degradedCells) || !w.member("avg_increase_sec", c.avgIncreaseSec) ||
      !w.member("median_increase_sec", c.medianIncreaseSec) || !w.key("counts") || !w.beginObject()) {
    return false;
  }
  for (int i = 0; i < kCoverageChangeCount; ++i) {
    if (!w.member(ToString(static_cast<CoverageChange>(i)), c.counts[static_cast<std::size_t>(i)])) return false;
  }
  if (!w.endObject() || !w.key("cells") || !w.beginArray()) return false;

  for (std::size_t i = 0; i < c.cells.size() && i < after.cells.size(); ++i) {
    const CoverageCell& cell = after.cells[i];
    if (!w.beginObject() || !w.member("col", cell.col) || !w.member("row", cell.row) ||
        !w.member("change", ToString(c.cells[i])) || !w.key("response_sec") ||
        !WriteSeconds(w, cell.responseSec) || !w.endObject()) {
      return false;
    }
  }
  return w.endArray() && w.endObject();
}

bool WriteWorldJsonFile(const std::string& path, std::uint64_t seed, const SynthesizedMap& map,
                        const std::vector<Tree>& trees, const std::vector<Facility>& facilities,
                        std::string& outError)
{
  return WriteDocumentFile(
      path,
      [&](JsonWriter& w) {
        const MapBounds& b = map.bounds;
        return w.beginObject() && w.key("seed") && w.uintValue(seed) && w.key("bounds") && w.beginObject() &&
               w.member("min_x", b.minX) && w.member("min_y", b.minY) && w.member("max_x", b.maxX) &&
               w.member("max_y", b.maxY) && w.endObject() && w.key("stats") && WriteMapStatsJson(w, map) &&
               w.key("graph") && WriteRoadGraphJson(w, map.graph) && w.key("trees") && WriteTreesJson(w, trees) &&
               w.key("facilities") && WriteFacilitiesJson(w, facilities) && w.endObject();
      },
      outError);
}

bool WriteTreesJsonFile(const std::string& path, const std::vector<Tree>& trees, std::string& outError)
{
  return WriteDocumentFile(
      path, [&](JsonWriter& w) { return w.beginObject() && w.key("trees") && WriteTreesJson(w, trees) && w.endObject(); },
      outError);
}

bool WriteDisasterJsonFile(const std::string& path, const DisasterResult& r, const DisasterConfig& cfg,
                           std::string& outError)
{
  return WriteDocumentFile(path, [&](JsonWriter& w) { return WriteDisasterJson(w, r, cfg); }, outError);
}

bool WriteObstructionsJsonFile(const std::string& path, const std::vector<RoadObstruction>& obstructions,
                               std::string& outError)
{
  return WriteDocumentFile(
      path,
      [&](JsonWriter& w) {
        return w.beginObject() && w.key("obstructions") && WriteObstructionsJson(w, obstructions) && w.endObject();
      },
      outError);
}

bool ParseTreesJson(const JsonValue& root, std::vector<Tree>& out, std::string& outError)
{
  out.clear();
  const JsonValue* arr = FindArraySection(root, "trees", outError);
  if (!arr) return false;

  for (std::size_t i = 0; i < arr->arrayValue.size(); ++i) {
    const JsonValue& item = arr->arrayValue[i];
    std::string err;
    if (!item.isObject()) {
      outError = "trees[" + std::to_string(i) + "]: expected object";
      return false;
    }

    Tree t;
    t.id = static_cast<int>(i);
    bool ok = GetInt(item, "id", t.id, false, err) && GetNumber(item, "x", t.pos.x, true, err) &&
              GetNumber(item, "y", t.pos.y, true, err) && GetNumber(item, "height", t.height, true, err) &&
              GetNumber(item, "trunk_width", t.trunkWidth, true, err);

    if (ok) {
      const JsonValue* level = FindJsonMember(item, "level");
      if (!level) {
        err = "missing key 'level'";
        ok = false;
      } else if (level->isString()) {
        ok = ParseVulnerabilityLevel(level->stringValue, t.level);
        if (!ok) err = "unknown level '" + level->stringValue + "'";
      } else if (level->isNumber()) {
        ok = ParseVulnerabilityLevel(std::to_string(static_cast<int>(level->numberValue)), t.level);
        if (!ok) err = "level must be 1, 2 or 3";
      } else {
        err = "expected string or number for key 'level'";
        ok = false;
      }
    }

    if (!ok) {
      outError = "trees[" + std::to_string(i) + "]: " + err;
      return false;
    }
    out.push_back(t);
  }

  outError.clear();
  return true;
}

bool LoadTreesJsonFile(const std::string& path, std::vector<Tree>& out, std::string& outError)
{
  JsonValue root;
  if (!ParseJsonFile(path, root, outError)) return false;
  if (!ParseTreesJson(root, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool ParseObstructionsJson(const JsonValue& root, std::vector<RoadObstruction>& out, std::string& outError)
{
  out.clear();
  const JsonValue* arr = FindArraySection(root, "obstructions", outError);
  if (!arr) return false;

  for (std::size_t i = 0; i < arr->arrayValue.size(); ++i) {
    const JsonValue& item = arr->arrayValue[i];
    if (!item.isObject()) {
      outError = "obstructions[" + std::to_string(i) + "]: expected object";
      return false;
    }

    RoadObstruction o;
    o.id = static_cast<int>(i);
    std::string err;
    bool ok = GetInt(item, "id", o.id, false, err) && GetInt(item, "edge", o.edge, true, err) &&
              GetInt(item, "event_id", o.eventId, false, err) &&
              GetNumber(item, "remaining_width", o.remainingWidth, true, err) &&
              GetNumber(item, "blocked_percentage", o.blockedPercentage, false, err) &&
              GetNumber(item, "blocked_length", o.blockedLength, false, err) &&
              GetBool(item, "approximate", o.approximate, err) && GetPolygon(item, "polygon", o.polygon, err);

    const JsonValue* dir = FindJsonMember(item, "directional");
    if (ok && dir) {
      if (!dir->isObject()) {
        err = "expected object for key 'directional'";
        ok = false;
      } else {
        o.hasDirectional = true;
        ok = GetNumber(*dir, "forward_remaining", o.forwardRemaining, true, err) &&
             GetNumber(*dir, "backward_remaining", o.backwardRemaining, true, err) &&
             GetBool(*dir, "forward_affected", o.forwardAffected, err) &&
             GetBool(*dir, "backward_affected", o.backwardAffected, err);
      }
    }

    if (!ok) {
      outError = "obstructions[" + std::to_string(i) + "]: " + err;
      return false;
    }
    out.push_back(std::move(o));
  }

  outError.clear();
  return true;
}

bool LoadObstructionsJsonFile(const std::string& path, std::vector<RoadObstruction>& out, std::string& outError)
{
  JsonValue root;
  if (!ParseJsonFile(path, root, outError)) return false;
  if (!ParseObstructionsJson(root, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace urbanres
