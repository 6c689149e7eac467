#pragma once

#include "urbanres/Disaster.hpp"
#include "urbanres/Facilities.hpp"
#include "urbanres/Json.hpp"
#include "urbanres/MapSynth.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/ServiceCoverage.hpp"
#include "urbanres/TreePlanting.hpp"

#include <string>

namespace urbanres {

// JSON helpers for every tunable config.
//
// Overrides use merge semantics: keys missing from the JSON leave the existing value
// unchanged, so a config file only needs to list what it changes. Field names are
// snake_case. Range checks are left to the Validate* functions of each module.

bool ApplyMapSynthConfigJson(const JsonValue& root, MapSynthConfig& ioCfg, std::string& outError);
bool ApplyTreePlantingConfigJson(const JsonValue& root, TreePlantingConfig& ioCfg, std::string& outError);
bool ApplyFacilityConfigJson(const JsonValue& root, FacilityConfig& ioCfg, std::string& outError);
bool ApplyDisasterConfigJson(const JsonValue& root, DisasterConfig& ioCfg, std::string& outError);
bool ApplyAnalyzerConfigJson(const JsonValue& root, AnalyzerConfig& ioCfg, std::string& outError);
bool ApplyCoverageConfigJson(const JsonValue& root, CoverageConfig& ioCfg, std::string& outError);

// Emit a config as one JSON object in the writer's current position.
bool WriteMapSynthConfig(JsonWriter& w, const MapSynthConfig& cfg);
bool WriteTreePlantingConfig(JsonWriter& w, const TreePlantingConfig& cfg);
bool WriteFacilityConfig(JsonWriter& w, const FacilityConfig& cfg);
bool WriteDisasterConfig(JsonWriter& w, const DisasterConfig& cfg);
bool WriteAnalyzerConfig(JsonWriter& w, const AnalyzerConfig& cfg);
bool WriteCoverageConfig(JsonWriter& w, const CoverageConfig& cfg);

// One file for the whole pipeline:
//   {"map":{...},"trees":{...},"facilities":{...},"disaster":{...},"analyzer":{...},"coverage":{...}}
// Every section is optional.
struct CombinedConfig {
  MapSynthConfig map{};
  TreePlantingConfig trees{};
  FacilityConfig facilities{};
  DisasterConfig disaster{};
  AnalyzerConfig analyzer{};
  CoverageConfig coverage{};

  bool hasMap = false;
  bool hasTrees = false;
  bool hasFacilities = false;
  bool hasDisaster = false;
  bool hasAnalyzer = false;
  bool hasCoverage = false;
};

bool ApplyCombinedConfigJson(const JsonValue& root, CombinedConfig& ioCfg, std::string& outError);

std::string CombinedConfigToJson(const CombinedConfig& cfg, int indentSpaces = 2);

// Merges the file into ioCfg.
bool LoadCombinedConfigJsonFile(const std::string& path, CombinedConfig& ioCfg, std::string& outError);
bool WriteCombinedConfigJsonFile(const std::string& path, const CombinedConfig& cfg, std::string& outError,
                                 int indentSpaces = 2);

} // namespace urbanres
