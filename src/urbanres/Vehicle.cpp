#include "urbanres/Vehicle.hpp"

#include <cmath>

namespace urbanres {

namespace {

bool PositiveFinite(double v)
{
  return std::isfinite(v) && v > 0.0;
}

} // namespace

const char* ToString(VehicleType t)
{
  switch (t) {
  case VehicleType::Pedestrian: return "pedestrian";
  case VehicleType::Motorcycle: return "motorcycle";
  case VehicleType::Car: return "car";
  case VehicleType::Ambulance: return "ambulance";
  case VehicleType::FireTruck: return "fire_truck";
  }
  return "car";
}

bool ParseVehicleType(const std::string& s, VehicleType& out)
{
  for (int i = 0; i < kVehicleTypeCount; ++i) {
    const VehicleType t = static_cast<VehicleType>(i);
    if (s == ToString(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

VehicleProfile DefaultVehicleProfile(VehicleType t)
{
  VehicleProfile v;
  v.type = t;
  switch (t) {
  case VehicleType::Pedestrian:
    v.width = 0.6;
    v.length = 0.6;
    v.maxSpeedKmh = 5.0;
    v.minRoadWidth = 0.8;
    v.canUseSidewalk = true;
    break;
  case VehicleType::Motorcycle:
    v.width = 0.8;
    v.length = 2.0;
    v.maxSpeedKmh = 60.0;
    v.minRoadWidth = 1.2;
    break;
  case VehicleType::Car:
    v.width = 1.8;
    v.length = 4.5;
    v.maxSpeedKmh = 50.0;
    v.minRoadWidth = 2.2;
    break;
  case VehicleType::Ambulance:
    v.width = 2.5;
    v.length = 7.0;
    v.maxSpeedKmh = 80.0;
    v.minRoadWidth = 3.0;
    break;
  case VehicleType::FireTruck:
    v.width = 3.0;
    v.length = 12.0;
    v.maxSpeedKmh = 60.0;
    v.minRoadWidth = 3.5;
    break;
  }
  return v;
}

bool ValidateVehicleProfile(const VehicleProfile& v, std::string& outError)
{
  if (!PositiveFinite(v.width) || !PositiveFinite(v.length)) {
    outError = "vehicle dimensions must be finite and > 0";
    return false;
  }
  if (!PositiveFinite(v.maxSpeedKmh)) {
    outError = "vehicle max speed must be finite and > 0";
    return false;
  }
  if (!PositiveFinite(v.minRoadWidth)) {
    outError = "vehicle min road width must be finite and > 0";
    return false;
  }
  outError.clear();
  return true;
}

} // namespace urbanres
