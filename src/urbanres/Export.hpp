#pragma once

#include "urbanres/Disaster.hpp"
#include "urbanres/Facilities.hpp"
#include "urbanres/Json.hpp"
#include "urbanres/MapSynth.hpp"
#include "urbanres/NetworkAnalyzer.hpp"
#include "urbanres/ServiceCoverage.hpp"
#include "urbanres/TreePlanting.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// JSON export of results, plus import of the two inputs that can come from outside:
// tree inventories and obstruction sets (so one disaster run can feed later routing runs).
//
// Coordinates are plane meters; points are written as [x, y] pairs and polygons as arrays
// of points.

bool WriteRoadGraphJson(JsonWriter& w, const RoadGraph& g);
bool WriteTreesJson(JsonWriter& w, const std::vector<Tree>& trees);
bool WriteFacilitiesJson(JsonWriter& w, const std::vector<Facility>& facilities);
bool WriteObstructionsJson(JsonWriter& w, const std::vector<RoadObstruction>& obstructions);
bool WriteDisasterJson(JsonWriter& w, const DisasterResult& r, const DisasterConfig& cfg);
bool WritePathJson(JsonWriter& w, const PathResult& p);
bool WriteServiceAreaJson(JsonWriter& w, const ServiceAreaResult& r);
bool WriteConnectivityJson(JsonWriter& w, const ConnectivityReport& r);
bool WriteCoverageJson(JsonWriter& w, const CoverageReport& r, bool includeCells);
bool WriteCoverageComparisonJson(JsonWriter& w, const CoverageComparison& c, const CoverageReport& after);

// {"seed":..., "bounds":{...}, "stats":{...}, "graph":{...}, "trees":[...], "facilities":[...]}
bool WriteWorldJsonFile(const std::string& path, std::uint64_t seed, const SynthesizedMap& map,
                        const std::vector<Tree>& trees, const std::vector<Facility>& facilities,
                        std::string& outError);

bool WriteTreesJsonFile(const std::string& path, const std::vector<Tree>& trees, std::string& outError);
bool WriteDisasterJsonFile(const std::string& path, const DisasterResult& r, const DisasterConfig& cfg,
                           std::string& outError);
bool WriteObstructionsJsonFile(const std::string& path, const std::vector<RoadObstruction>& obstructions,
                               std::string& outError);

// {"trees":[{"x":..,"y":..,"level":"I"|"II"|"III"|1..3,"height":..,"trunk_width":..}, ...]}
// "id" is optional and defaults to the array index.
bool ParseTreesJson(const JsonValue& root, std::vector<Tree>& out, std::string& outError);
bool LoadTreesJsonFile(const std::string& path, std::vector<Tree>& out, std::string& outError);

// {"obstructions":[{"edge":..,"remaining_width":.., ...}, ...]}. Also accepts a full
// disaster export, which carries the same array.
bool ParseObstructionsJson(const JsonValue& root, std::vector<RoadObstruction>& out, std::string& outError);
bool LoadObstructionsJsonFile(const std::string& path, std::vector<RoadObstruction>& out, std::string& outError);

} // namespace urbanres
