#pragma once

#include "models/CoreTypes.hpp"
#include "models/Errors.hpp"
#include <cmath>
#include <string>

// Canonical unit each field is normalized to.
inline const char *CanonicalUnit(Field f) {
  switch (f) {
  case Field::Speed:
    return "m/s";
  case Field::HeartRate:
    return "bpm";
  case Field::Power:
    return "W";
  case Field::Cadence:
    return "rpm";
  case Field::Elevation:
  case Field::Distance:
    return "m";
  case Field::Latitude:
  case Field::Longitude:
    return "deg";
  }
  return "";
}

// Multiplier taking a value tagged `unit` to the canonical unit of `f`.
// An empty tag means the value is already canonical.
inline double UnitFactor(Field f, const std::string &unit) {
  if (unit.empty() || unit == CanonicalUnit(f))
    return 1.0;

  switch (f) {
  case Field::Latitude:
  case Field::Longitude:
    if (unit == "degrees")
      return 1.0;
    if (unit == "semicircles")
      return 180.0 / std::pow(2.0, 31);
    break;
  case Field::Speed:
    if (unit == "mm/s")
      return 0.001;
    if (unit == "km/h")
      return 1.0 / 3.6;
    break;
  case Field::Elevation:
    if (unit == "ft")
      return 0.3048;
    break;
  case Field::Distance:
    if (unit == "km")
      return 1000.0;
    break;
  case Field::Cadence:
    if (unit == "spm")
      return 0.5;
    break;
  case Field::Power:
    if (unit == "watts")
      return 1.0;
    break;
  case Field::HeartRate:
    break;
  }
  throw UnitAmbiguityError(std::string("unrecognized unit '") + unit +
                           "' for field " + FieldToString(f));
}
