#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using Json = nlohmann::json;

// Geographic coordinate in decimal degrees.
struct Coordinate {
  double lat;
  double lon;
};

// Optional per-sample measurements carried by a recording.
enum class Field : uint8_t {
  Speed,
  HeartRate,
  Power,
  Cadence,
  Elevation,
  Distance,
  Latitude,
  Longitude
};

constexpr std::size_t kFieldCount = 8;

constexpr std::array<Field, kFieldCount> kAllFields = {
    Field::Speed,     Field::HeartRate, Field::Power,    Field::Cadence,
    Field::Elevation, Field::Distance,  Field::Latitude, Field::Longitude};

inline const char *FieldToString(Field f) {
  switch (f) {
  case Field::Speed:
    return "speed";
  case Field::HeartRate:
    return "heart_rate";
  case Field::Power:
    return "power";
  case Field::Cadence:
    return "cadence";
  case Field::Elevation:
    return "elevation";
  case Field::Distance:
    return "distance";
  case Field::Latitude:
    return "lat";
  case Field::Longitude:
    return "lon";
  }
  return "unknown";
}

inline std::optional<Field> FieldFromString(const std::string &name) {
  for (Field f : kAllFields) {
    if (name == FieldToString(f))
      return f;
  }
  return std::nullopt;
}

// One timestamped observation. Timestamps are seconds since the Unix epoch.
struct Sample {
  double timestamp = 0.0;
  std::array<std::optional<double>, kFieldCount> values{};

  bool has(Field f) const {
    return values[static_cast<std::size_t>(f)].has_value();
  }
  std::optional<double> get(Field f) const {
    return values[static_cast<std::size_t>(f)];
  }
  void set(Field f, double v) { values[static_cast<std::size_t>(f)] = v; }
};

// Ordered samples plus the device-native unit tag of each field.
struct SampleStream {
  std::vector<Sample> samples;
  std::map<Field, std::string> units;

  bool has(Field f) const {
    for (const auto &s : samples) {
      if (s.has(f))
        return true;
    }
    return false;
  }
  std::string unit(Field f) const {
    auto it = units.find(f);
    return it == units.end() ? std::string() : it->second;
  }
};

enum class EventKind : uint8_t { Start, Stop };

// Where an event came from: the recording device, or the speed-threshold
// detector.
enum class EventProvenance : uint8_t { Device, Detected };

struct Event {
  double timestamp = 0.0;
  EventKind kind = EventKind::Start;
  EventProvenance provenance = EventProvenance::Device;
  std::string type; // device sub-kind: "start", "stop_all", ...
};

inline const char *EventKindToString(EventKind k) {
  return k == EventKind::Start ? "start" : "stop";
}

inline const char *ProvenanceToString(EventProvenance p) {
  return p == EventProvenance::Device ? "device" : "detected";
}

// Everything a decoder pulls out of one activity file.
struct DecodedActivity {
  SampleStream records;
  std::vector<Event> events;
  Json summary = Json::object();   // "<field>_<stat>" -> value
  std::vector<Json> laps;          // one object per lap, same key scheme
};
