#pragma once
#include "models/CoreTypes.hpp"
#include <string>

// Garmin FIT activity files, read through the FIT SDK.
//
// Collects record (samples), event (timer start/stop), session (summary) and
// lap messages. Positions stay in semicircles; the table builder converts
// them. The SDK applies field scales, so speed arrives in m/s.
class FitDecoder {
public:
  DecodedActivity decode(const std::string &bytes) const;
};
