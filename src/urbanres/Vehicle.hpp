#pragma once

#include <cstdint>
#include <string>

namespace urbanres {

enum class VehicleType : std::uint8_t {
  Pedestrian = 0,
  Motorcycle = 1,
  Car = 2,
  Ambulance = 3,
  FireTruck = 4,
};

constexpr int kVehicleTypeCount = 5;

const char* ToString(VehicleType t);

// Accepts the snake_case names used by the CLI and JSON ("fire_truck", ...).
bool ParseVehicleType(const std::string& s, VehicleType& out);

// Physical constraints applied by the router. All values in meters / km/h.
struct VehicleProfile {
  VehicleType type = VehicleType::Car;
  double width = 1.8;
  double length = 4.5;
  double maxSpeedKmh = 50.0;
  double minRoadWidth = 2.2; // narrowest passable road
  bool canUseSidewalk = false;
};

VehicleProfile DefaultVehicleProfile(VehicleType t);

// Every dimension and speed must be finite and positive.
bool ValidateVehicleProfile(const VehicleProfile& v, std::string& outError);

} // namespace urbanres
