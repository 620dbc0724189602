#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Blocking elevation lookup for lat/lon points. Wire this to an HTTP
// service, a local DEM or a test double.
class ElevationService {
public:
  virtual ~ElevationService() = default;

  // One elevation (metres) per coordinate, in order.
  virtual std::vector<double>
  lookup(const std::vector<Coordinate> &coords) const = 0;
};
