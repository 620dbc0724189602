#pragma once
#include "models/CoreTypes.hpp"
#include <string>

// Garmin Training Center XML. Each Track opens a block with a device start
// at its first trackpoint and closes with a device stop at its last.
class TcxDecoder {
public:
  DecodedActivity decode(const std::string &bytes) const;
};

// GPS Exchange Format 1.1 with the Garmin TrackPointExtension. Each trkseg
// is bracketed by a device start/stop pair.
class GpxDecoder {
public:
  DecodedActivity decode(const std::string &bytes) const;
};
