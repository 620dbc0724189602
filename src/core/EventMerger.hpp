#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Merge device-reported and detected events into one timeline, one event per
// distinct timestamp. On a collision the device event wins. Both inputs must
// be sorted by timestamp.
std::vector<Event> merge_events(const std::vector<Event> &device,
                                const std::vector<Event> &detected);
