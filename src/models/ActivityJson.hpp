#pragma once

#include "io/TimeUtil.hpp"
#include "models/CoreTypes.hpp"
#include "models/Errors.hpp"
#include <iostream>
#include <string>
#include <vector>

// JSON interchange encoding of an activity:
//
// {
//   "units":   {"speed": "mm/s", "lat": "semicircles", ...},
//   "samples": [{"timestamp": 1559374200, "speed": 2.1, ...}, ...],
//   "events":  [{"timestamp": ..., "kind": "start", "provenance": "device",
//                "type": "start"}, ...],
//   "summary": {"distance_total": 5012.3, ...},
//   "laps":    [{"timestamp_start": ..., "distance_total": ...}, ...]
// }
//
// Timestamps are Unix seconds or xsd:dateTime strings.

// Define from_json() overloads for structs to work with json::get() function

inline double timestamp_from_json(const Json &j) {
  if (j.is_number())
    return j.get<double>();
  if (j.is_string())
    return parse_iso8601(j.get<std::string>());
  throw DecodeError("timestamp must be a number or an ISO-8601 string");
}

// ---- Sample ----
inline void from_json(const Json &j, Sample &s) {
  if (!j.is_object() || !j.contains("timestamp"))
    throw DecodeError("sample without timestamp");
  s.timestamp = timestamp_from_json(j.at("timestamp"));

  auto read = [&](const char *key, Field f) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return;
    if (!it->is_number())
      throw DecodeError(std::string("sample field '") + key +
                        "' is not a number");
    s.set(f, it->get<double>());
  };
  for (Field f : kAllFields)
    read(FieldToString(f), f);
  // long-form position names
  if (!s.has(Field::Latitude))
    read("latitude", Field::Latitude);
  if (!s.has(Field::Longitude))
    read("longitude", Field::Longitude);
}

// ---- Event ----
inline void from_json(const Json &j, Event &e) {
  if (!j.is_object() || !j.contains("timestamp"))
    throw DecodeError("event without timestamp");
  e.timestamp = timestamp_from_json(j.at("timestamp"));

  const std::string kind = j.value("kind", "");
  if (kind == "start")
    e.kind = EventKind::Start;
  else if (kind == "stop")
    e.kind = EventKind::Stop;
  else
    throw DecodeError("event kind must be 'start' or 'stop', got '" + kind +
                      "'");

  const std::string prov = j.value("provenance", "device");
  if (prov == "device")
    e.provenance = EventProvenance::Device;
  else if (prov == "detected")
    e.provenance = EventProvenance::Detected;
  else
    throw DecodeError("unknown event provenance '" + prov + "'");

  e.type = j.value("type", kind);
}

// ---- DecodedActivity ----
inline void from_json(const Json &j, DecodedActivity &a) {
  if (!j.is_object())
    throw DecodeError("activity document must be a JSON object");

  a.records = SampleStream{};
  if (j.contains("units") && j["units"].is_object()) {
    for (auto it = j["units"].begin(); it != j["units"].end(); ++it) {
      auto f = FieldFromString(it.key());
      if (!f) {
        std::cerr << "[decode] ignoring unit for unknown field '" << it.key()
                  << "'\n";
        continue;
      }
      a.records.units[*f] = it.value().get<std::string>();
    }
  }
  if (j.contains("samples") && j["samples"].is_array()) {
    for (const auto &s : j["samples"])
      a.records.samples.push_back(s.get<Sample>());
  }

  a.events.clear();
  if (j.contains("events") && j["events"].is_array()) {
    for (const auto &e : j["events"])
      a.events.push_back(e.get<Event>());
  }

  a.summary = j.value("summary", Json::object());
  a.laps.clear();
  if (j.contains("laps") && j["laps"].is_array()) {
    for (const auto &lap : j["laps"])
      a.laps.push_back(lap);
  }
}

// ---- Serialization back out (used by reports) ----
inline void to_json(Json &j, const Event &e) {
  j = Json{{"timestamp", e.timestamp},
           {"kind", EventKindToString(e.kind)},
           {"provenance", ProvenanceToString(e.provenance)},
           {"type", e.type}};
}
