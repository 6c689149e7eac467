#include "urbanres/ConfigIO.hpp"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>

namespace urbanres {

namespace {

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  double d = static_cast<double>(io);
  if (!ApplyF64(root, key, d, err)) return false;
  if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max()) || d != std::floor(d)) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

// Per-level values, ordered I, II, III.
bool ApplyLevelArray(const JsonValue& root, const char* key, std::array<double, kVulnerabilityLevelCount>& io,
                     std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isArray() || v->arrayValue.size() != static_cast<std::size_t>(kVulnerabilityLevelCount)) {
    err = std::string("expected array of 3 numbers (I, II, III) for key '") + key + "'";
    return false;
  }
  std::array<double, kVulnerabilityLevelCount> tmp{};
  for (std::size_t i = 0; i < tmp.size(); ++i) {
    const JsonValue& e = v->arrayValue[i];
    if (!e.isNumber() || !std::isfinite(e.numberValue)) {
      err = std::string("non-numeric entry in '") + key + "'";
      return false;
    }
    tmp[i] = e.numberValue;
  }
  io = tmp;
  return true;
}

template <typename Cfg, typename ApplyFn>
bool ApplySection(const JsonValue& root, const char* key, Cfg& cfg, bool& hasSection, ApplyFn apply,
                  std::string& outError)
{
  const JsonValue* sec = FindJsonMember(root, key);
  if (!sec) return true;
  if (!sec->isObject()) {
    outError = std::string(key) + " must be an object";
    return false;
  }
  std::string err;
  if (!apply(*sec, cfg, err)) {
    outError = std::string(key) + ": " + err;
    return false;
  }
  hasSection = true;
  return true;
}

bool WriteLevelArray(JsonWriter& w, const char* key, const std::array<double, kVulnerabilityLevelCount>& v)
{
  if (!w.key(key) || !w.beginArray()) return false;
  for (const double d : v) {
    if (!w.numberValue(d)) return false;
  }
  return w.endArray();
}

} // namespace

bool ApplyMapSynthConfigJson(const JsonValue& root, MapSynthConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "map config JSON must be an object";
    return false;
  }

  std::string err;
  const bool ok = ApplyF64(root, "width", ioCfg.width, err) && ApplyF64(root, "height", ioCfg.height, err) &&
                  ApplyI32(root, "main_road_count", ioCfg.mainRoadCount, err) &&
                  ApplyF64(root, "main_road_width", ioCfg.mainRoadWidth, err) &&
                  ApplyI32(root, "main_road_lanes", ioCfg.mainRoadLanes, err) &&
                  ApplyF64(root, "main_road_speed_kmh", ioCfg.mainRoadSpeedKmh, err) &&
                  ApplyF64(root, "main_road_inset", ioCfg.mainRoadInset, err) &&
                  ApplyI32(root, "diagonal_min", ioCfg.diagonalMin, err) &&
                  ApplyI32(root, "diagonal_max", ioCfg.diagonalMax, err) &&
                  ApplyF64(root, "diagonal_jitter_deg", ioCfg.diagonalJitterDeg, err) &&
                  ApplyF64(root, "diagonal_overshoot", ioCfg.diagonalOvershoot, err) &&
                  ApplyF64(root, "secondary_road_width", ioCfg.secondaryRoadWidth, err) &&
                  ApplyI32(root, "secondary_road_lanes", ioCfg.secondaryRoadLanes, err) &&
                  ApplyF64(root, "secondary_road_speed_kmh", ioCfg.secondaryRoadSpeedKmh, err) &&
                  ApplyI32(root, "alleys_per_block_min", ioCfg.alleysPerBlockMin, err) &&
                  ApplyI32(root, "alleys_per_block_max", ioCfg.alleysPerBlockMax, err) &&
                  ApplyF64(root, "full_length_alley_chance", ioCfg.fullLengthAlleyChance, err) &&
                  ApplyF64(root, "horizontal_alley_chance", ioCfg.horizontalAlleyChance, err) &&
                  ApplyF64(root, "alley_bidirectional_chance", ioCfg.alleyBidirectionalChance, err) &&
                  ApplyF64(root, "alley_tilt_chance", ioCfg.alleyTiltChance, err) &&
                  ApplyF64(root, "alley_max_tilt_deg", ioCfg.alleyMaxTiltDeg, err) &&
                  ApplyF64(root, "alley_block_margin", ioCfg.alleyBlockMargin, err) &&
                  ApplyF64(root, "alley_position_min", ioCfg.alleyPositionMin, err) &&
                  ApplyF64(root, "alley_position_max", ioCfg.alleyPositionMax, err) &&
                  ApplyF64(root, "partial_alley_min_frac", ioCfg.partialAlleyMinFrac, err) &&
                  ApplyF64(root, "partial_alley_max_frac", ioCfg.partialAlleyMaxFrac, err) &&
                  ApplyF64(root, "min_road_length", ioCfg.minRoadLength, err);
  if (!ok) {
    outError = err;
    return false;
  }
  outError.clear();
  return true;
}

bool ApplyTreePlantingConfigJson(const JsonValue& root, TreePlantingConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "tree config JSON must be an object";
    return false;
  }

  std::string err;
  const bool ok = ApplyF64(root, "spacing", ioCfg.spacing, err) && ApplyF64(root, "max_offset", ioCfg.maxOffset, err) &&
                  ApplyF64(root, "road_buffer", ioCfg.roadBuffer, err) &&
                  ApplyBool(root, "both_sides", ioCfg.bothSides, err) &&
                  ApplyLevelArray(root, "level_weights", ioCfg.levelWeights, err) &&
                  ApplyF64(root, "min_height", ioCfg.minHeight, err) &&
                  ApplyF64(root, "max_height", ioCfg.maxHeight, err) &&
                  ApplyF64(root, "min_trunk_width", ioCfg.minTrunkWidth, err) &&
                  ApplyF64(root, "max_trunk_width", ioCfg.maxTrunkWidth, err);
  if (!ok) {
    outError = err;
    return false;
  }
  outError.clear();
  return true;
}

bool ApplyFacilityConfigJson(const JsonValue& root, FacilityConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "facility config JSON must be an object";
    return false;
  }

  std::string err;
  if (!ApplyI32(root, "ambulance_stations", ioCfg.ambulanceStations, err) ||
      !ApplyI32(root, "shelters", ioCfg.shelters, err) ||
      !ApplyI32(root, "shelter_capacity_min", ioCfg.shelterCapacityMin, err) ||
      !ApplyI32(root, "shelter_capacity_max", ioCfg.shelterCapacityMax, err)) {
    outError = err;
    return false;
  }
  outError.clear();
  return true;
}

bool ApplyDisasterConfigJson(const JsonValue& root, DisasterConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "disaster config JSON must be an object";
    return false;
  }

  std::string err;
  if (!ApplyF64(root, "intensity", ioCfg.intensity, err) ||
      !ApplyLevelArray(root, "base_rates", ioCfg.baseRates, err) ||
      !ApplyI32(root, "cross_sections", ioCfg.crossSections, err) ||
      !ApplyF64(root, "direction_threshold", ioCfg.directionThreshold, err) ||
      !ApplyF64(root, "fallback_blockage", ioCfg.fallbackBlockage, err)) {
    outError = err;
    return false;
  }
  outError.clear();
  return true;
}

bool ApplyAnalyzerConfigJson(const JsonValue& root, AnalyzerConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "analyzer config JSON must be an object";
    return false;
  }

  std::string err;
  AttachConfig& a = ioCfg.attach;
  if (!ApplyF64(root, "snap_distance", a.snapDistance, err) ||
      !ApplyF64(root, "access_tolerance", a.accessTolerance, err) ||
      !ApplyF64(root, "max_attach_distance", a.maxAttachDistance, err) ||
      !ApplyF64(root, "access_speed_kmh", a.accessSpeedKmh, err) ||
      !ApplyF64(root, "access_width", a.accessWidth, err) ||
      !ApplyI32(root, "max_expansions", ioCfg.maxExpansions, err) ||
      !ApplyI32(root, "partial_max_iterations", ioCfg.partialMaxIterations, err) ||
      !ApplyF64(root, "diversity_factor", ioCfg.diversityFactor, err) ||
      !ApplyF64(root, "max_overlap_fraction", ioCfg.maxOverlapFraction, err) ||
      !ApplyI32(root, "max_alternative_paths", ioCfg.maxAlternativePaths, err)) {
    outError = err;
    return false;
  }
  outError.clear();
  return true;
}

bool ApplyCoverageConfigJson(const JsonValue& root, CoverageConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "coverage config JSON must be an object";
    return false;
  }

  std::string err;
  if (!ApplyF64(root, "cell_size", ioCfg.cellSize, err) || !ApplyF64(root, "excellent_sec", ioCfg.excellentSec, err) ||
      !ApplyF64(root, "good_sec", ioCfg.goodSec, err) || !ApplyF64(root, "fair_sec", ioCfg.fairSec, err) ||
      !ApplyF64(root, "max_response_sec", ioCfg.maxResponseSec, err)) {
    outError = err;
    return false;
  }

  const JsonValue* vehicle = FindJsonMember(root, "vehicle");
  if (vehicle) {
    if (!vehicle->isString()) {
      outError = "expected string for key 'vehicle'";
      return false;
    }
    VehicleType t{};
    if (!ParseVehicleType(vehicle->stringValue, t)) {
      outError = "unknown vehicle: '" + vehicle->stringValue + "'";
      return false;
    }
    ioCfg.vehicle = t;
  }

  outError.clear();
  return true;
}

bool WriteMapSynthConfig(JsonWriter& w, const MapSynthConfig& cfg)
{
  return w.beginObject() && w.member("width", cfg.width) && w.member("height", cfg.height) &&
         w.member("main_road_count", cfg.mainRoadCount) && w.member("main_road_width", cfg.mainRoadWidth) &&
         w.member("main_road_lanes", cfg.mainRoadLanes) && w.member("main_road_speed_kmh", cfg.mainRoadSpeedKmh) &&
         w.member("main_road_inset", cfg.mainRoadInset) && w.member("diagonal_min", cfg.diagonalMin) &&
         w.member("diagonal_max", cfg.diagonalMax) && w.member("diagonal_jitter_deg", cfg.diagonalJitterDeg) &&
         w.member("diagonal_overshoot", cfg.diagonalOvershoot) &&
         w.member("secondary_road_width", cfg.secondaryRoadWidth) &&
         w.member("secondary_road_lanes", cfg.secondaryRoadLanes) &&
         w.member("secondary_road_speed_kmh", cfg.secondaryRoadSpeedKmh) &&
         w.member("alleys_per_block_min", cfg.alleysPerBlockMin) &&
         w.member("alleys_per_block_max", cfg.alleysPerBlockMax) &&
         w.member("full_length_alley_chance", cfg.fullLengthAlleyChance) &&
         w.member("horizontal_alley_chance", cfg.horizontalAlleyChance) &&
         w.member("alley_bidirectional_chance", cfg.alleyBidirectionalChance) &&
         w.member("alley_tilt_chance", cfg.alleyTiltChance) && w.member("alley_max_tilt_deg", cfg.alleyMaxTiltDeg) &&
         w.member("alley_block_margin", cfg.alleyBlockMargin) &&
         w.member("alley_position_min", cfg.alleyPositionMin) &&
         w.member("alley_position_max", cfg.alleyPositionMax) &&
         w.member("partial_alley_min_frac", cfg.partialAlleyMinFrac) &&
         w.member("partial_alley_max_frac", cfg.partialAlleyMaxFrac) &&
         w.member("min_road_length", cfg.minRoadLength) && w.endObject();
}

bool WriteTreePlantingConfig(JsonWriter& w, const TreePlantingConfig& cfg)
{
  return w.beginObject() && w.member("spacing", cfg.spacing) && w.member("max_offset", cfg.maxOffset) &&
         w.member("road_buffer", cfg.roadBuffer) && w.member("both_sides", cfg.bothSides) &&
         WriteLevelArray(w, "level_weights", cfg.levelWeights) && w.member("min_height", cfg.minHeight) &&
         w.member("max_height", cfg.maxHeight) && w.member("min_trunk_width", cfg.minTrunkWidth) &&
         w.member("max_trunk_width", cfg.maxTrunkWidth) && w.endObject();
}

bool WriteFacilityConfig(JsonWriter& w, const FacilityConfig& cfg)
{
  return w.beginObject() && w.member("ambulance_stations", cfg.ambulanceStations) &&
         w.member("shelters", cfg.shelters) && w.member("shelter_capacity_min", cfg.shelterCapacityMin) &&
         w.member("shelter_capacity_max", cfg.shelterCapacityMax) && w.endObject();
}

bool WriteDisasterConfig(JsonWriter& w, const DisasterConfig& cfg)
{
  return w.beginObject() && w.member("intensity", cfg.intensity) && WriteLevelArray(w, "base_rates", cfg.baseRates) &&
         w.member("cross_sections", cfg.crossSections) && w.member("direction_threshold", cfg.directionThreshold) &&
         w.member("fallback_blockage", cfg.fallbackBlockage) && w.endObject();
}

bool WriteAnalyzerConfig(JsonWriter& w, const AnalyzerConfig& cfg)
{
  const AttachConfig& a = cfg.attach;
  return w.beginObject() && w.member("snap_distance", a.snapDistance) &&
         w.member("access_tolerance", a.accessTolerance) && w.member("max_attach_distance", a.maxAttachDistance) &&
         w.member("access_speed_kmh", a.accessSpeedKmh) && w.member("access_width", a.accessWidth) &&
         w.member("max_expansions", cfg.maxExpansions) &&
         w.member("partial_max_iterations", cfg.partialMaxIterations) &&
         w.member("diversity_factor", cfg.diversityFactor) &&
         w.member("max_overlap_fraction", cfg.maxOverlapFraction) &&
         w.member("max_alternative_paths", cfg.maxAlternativePaths) && w.endObject();
}

bool WriteCoverageConfig(JsonWriter& w, const CoverageConfig& cfg)
{
  return w.beginObject() && w.member("cell_size", cfg.cellSize) && w.member("excellent_sec", cfg.excellentSec) &&
         w.member("good_sec", cfg.goodSec) && w.member("fair_sec", cfg.fairSec) &&
         w.member("max_response_sec", cfg.maxResponseSec) && w.member("vehicle", ToString(cfg.vehicle)) &&
         w.endObject();
}

bool ApplyCombinedConfigJson(const JsonValue& root, CombinedConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "combined config JSON must be an object";
    return false;
  }

  const bool ok =
      ApplySection(root, "map", ioCfg.map, ioCfg.hasMap, ApplyMapSynthConfigJson, outError) &&
      ApplySection(root, "trees", ioCfg.trees, ioCfg.hasTrees, ApplyTreePlantingConfigJson, outError) &&
      ApplySection(root, "facilities", ioCfg.facilities, ioCfg.hasFacilities, ApplyFacilityConfigJson, outError) &&
      ApplySection(root, "disaster", ioCfg.disaster, ioCfg.hasDisaster, ApplyDisasterConfigJson, outError) &&
      ApplySection(root, "analyzer", ioCfg.analyzer, ioCfg.hasAnalyzer, ApplyAnalyzerConfigJson, outError) &&
      ApplySection(root, "coverage", ioCfg.coverage, ioCfg.hasCoverage, ApplyCoverageConfigJson, outError);
  if (!ok) return false;

  outError.clear();
  return true;
}

std::string CombinedConfigToJson(const CombinedConfig& cfg, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;

  std::ostringstream oss;
  JsonWriter w(oss, opt);
  const bool ok = w.beginObject() && w.key("map") && WriteMapSynthConfig(w, cfg.map) && w.key("trees") &&
                  WriteTreePlantingConfig(w, cfg.trees) && w.key("facilities") &&
                  WriteFacilityConfig(w, cfg.facilities) && w.key("disaster") &&
                  WriteDisasterConfig(w, cfg.disaster) && w.key("analyzer") &&
                  WriteAnalyzerConfig(w, cfg.analyzer) && w.key("coverage") &&
                  WriteCoverageConfig(w, cfg.coverage) && w.endObject();
  if (!ok) return std::string();
  oss << '\n';
  return oss.str();
}

bool LoadCombinedConfigJsonFile(const std::string& path, CombinedConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  if (!ParseJsonFile(path, root, outError)) return false;

  if (!ApplyCombinedConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WriteCombinedConfigJsonFile(const std::string& path, const CombinedConfig& cfg, std::string& outError,
                                 int indentSpaces)
{
  const std::string text = CombinedConfigToJson(cfg, indentSpaces);
  if (text.empty()) {
    outError = "failed to serialize config";
    return false;
  }

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }
  f << text;
  if (!f) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace urbanres
