#include "io/XmlDecoders.hpp"
#include "io/TimeUtil.hpp"
#include "models/Errors.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <pugixml.hpp>

// ---- Small helpers ----

// Element name without its namespace prefix ("ns3:TPX" -> "TPX").
static const char *local_name(const char *name) {
  const char *colon = std::strrchr(name, ':');
  return colon ? colon + 1 : name;
}

static pugi::xml_node child(pugi::xml_node n, const char *name) {
  for (pugi::xml_node c : n.children()) {
    if (c.type() == pugi::node_element &&
        std::strcmp(local_name(c.name()), name) == 0)
      return c;
  }
  return {};
}

// Depth-first search for the first descendant element called `name`.
static pugi::xml_node descendant(pugi::xml_node n, const char *name) {
  for (pugi::xml_node c : n.children()) {
    if (c.type() != pugi::node_element)
      continue;
    if (std::strcmp(local_name(c.name()), name) == 0)
      return c;
    if (pugi::xml_node hit = descendant(c, name))
      return hit;
  }
  return {};
}

static std::optional<double> number(pugi::xml_node n) {
  if (!n)
    return std::nullopt;
  const char *text = n.child_value();
  char *end = nullptr;
  const double v = std::strtod(text, &end);
  if (end == text)
    return std::nullopt;
  return v;
}

static std::optional<double> number_attr(pugi::xml_node n, const char *name) {
  pugi::xml_attribute a = n.attribute(name);
  if (!a)
    return std::nullopt;
  const char *text = a.value();
  char *end = nullptr;
  const double v = std::strtod(text, &end);
  if (end == text)
    return std::nullopt;
  return v;
}

static void put(Json &obj, const char *key, std::optional<double> v) {
  if (v)
    obj[key] = *v;
}

static void load(pugi::xml_document &doc, const std::string &bytes,
                 const char *what) {
  pugi::xml_parse_result r = doc.load_buffer(bytes.data(), bytes.size());
  if (!r)
    throw DecodeError(std::string(what) + " parse error at offset " +
                      std::to_string(r.offset) + ": " + r.description());
}

static void canonical_units(SampleStream &records) {
  records.units[Field::Latitude] = "deg";
  records.units[Field::Longitude] = "deg";
  records.units[Field::Speed] = "m/s";
  records.units[Field::Cadence] = "rpm";
}

// Push a start/stop pair around the samples appended since `first`.
static void bracket(DecodedActivity &out, std::size_t first) {
  if (out.records.samples.size() <= first)
    return;
  out.events.push_back({out.records.samples[first].timestamp, EventKind::Start,
                        EventProvenance::Device, "start"});
  out.events.push_back({out.records.samples.back().timestamp, EventKind::Stop,
                        EventProvenance::Device, "stop"});
}

// ===== TCX =====

static std::optional<Sample> tcx_trackpoint(pugi::xml_node tp) {
  pugi::xml_node time = child(tp, "Time");
  if (!time)
    return std::nullopt;

  Sample s;
  s.timestamp = parse_iso8601(time.child_value());
  if (pugi::xml_node pos = child(tp, "Position")) {
    if (auto v = number(child(pos, "LatitudeDegrees")))
      s.set(Field::Latitude, *v);
    if (auto v = number(child(pos, "LongitudeDegrees")))
      s.set(Field::Longitude, *v);
  }
  if (auto v = number(child(tp, "AltitudeMeters")))
    s.set(Field::Elevation, *v);
  if (auto v = number(child(tp, "DistanceMeters")))
    s.set(Field::Distance, *v);
  if (auto v = number(child(child(tp, "HeartRateBpm"), "Value")))
    s.set(Field::HeartRate, *v);
  if (auto v = number(child(tp, "Cadence")))
    s.set(Field::Cadence, *v);

  pugi::xml_node tpx = child(child(tp, "Extensions"), "TPX");
  if (auto v = number(child(tpx, "Speed")))
    s.set(Field::Speed, *v);
  if (auto v = number(child(tpx, "RunCadence")))
    s.set(Field::Cadence, *v);
  if (auto v = number(child(tpx, "Watts")))
    s.set(Field::Power, *v);
  return s;
}

static Json tcx_lap(pugi::xml_node lap) {
  Json j = Json::object();
  if (pugi::xml_attribute start = lap.attribute("StartTime"))
    j["timestamp_start"] = parse_iso8601(start.value());
  put(j, "time_timer", number(child(lap, "TotalTimeSeconds")));
  put(j, "distance_total", number(child(lap, "DistanceMeters")));
  put(j, "speed_max", number(child(lap, "MaximumSpeed")));
  put(j, "calories_total", number(child(lap, "Calories")));
  put(j, "heart_rate_avg",
      number(child(child(lap, "AverageHeartRateBpm"), "Value")));
  put(j, "heart_rate_max",
      number(child(child(lap, "MaximumHeartRateBpm"), "Value")));
  put(j, "cadence_avg", number(child(lap, "Cadence")));
  pugi::xml_node lx = child(child(lap, "Extensions"), "LX");
  put(j, "speed_avg", number(child(lx, "AvgSpeed")));
  put(j, "cadence_avg", number(child(lx, "AvgRunCadence")));
  put(j, "power_avg", number(child(lx, "AvgWatts")));
  if (pugi::xml_node trig = child(lap, "TriggerMethod"))
    j["trigger"] = trig.child_value();
  return j;
}

DecodedActivity TcxDecoder::decode(const std::string &bytes) const {
  pugi::xml_document doc;
  load(doc, bytes, "TCX");
  pugi::xml_node root = child(doc, "TrainingCenterDatabase");
  if (!root)
    throw DecodeError("not a TCX document");

  pugi::xml_node activities = child(root, "Activities");
  pugi::xml_node activity;
  int n_activities = 0;
  for (pugi::xml_node c : activities.children()) {
    if (std::strcmp(local_name(c.name()), "Activity") == 0) {
      activity = c;
      ++n_activities;
    }
  }
  if (n_activities == 0)
    throw DecodeError("TCX document holds no Activity");
  if (n_activities > 1)
    throw NotSupportedError("TCX document holds more than one Activity");

  DecodedActivity out;
  canonical_units(out.records);
  if (pugi::xml_attribute sport = activity.attribute("Sport"))
    out.summary["sport"] = sport.value();
  if (pugi::xml_node id = child(activity, "Id"))
    out.summary["timestamp_start"] = parse_iso8601(id.child_value());
  if (pugi::xml_node name = child(child(activity, "Creator"), "Name"))
    out.summary["device"] = name.child_value();

  std::size_t skipped = 0;
  double timer_total = 0.0, distance_total = 0.0, calories_total = 0.0;
  for (pugi::xml_node lap : activity.children()) {
    if (std::strcmp(local_name(lap.name()), "Lap") != 0)
      continue;
    Json lap_json = tcx_lap(lap);
    timer_total += lap_json.value("time_timer", 0.0);
    distance_total += lap_json.value("distance_total", 0.0);
    calories_total += lap_json.value("calories_total", 0.0);
    out.laps.push_back(std::move(lap_json));

    for (pugi::xml_node track : lap.children()) {
      if (std::strcmp(local_name(track.name()), "Track") != 0)
        continue;
      const std::size_t first = out.records.samples.size();
      for (pugi::xml_node tp : track.children()) {
        if (std::strcmp(local_name(tp.name()), "Trackpoint") != 0)
          continue;
        if (auto s = tcx_trackpoint(tp))
          out.records.samples.push_back(*s);
        else
          ++skipped;
      }
      bracket(out, first);
    }
  }
  if (skipped > 0)
    std::cerr << "[decode] skipped " << skipped
              << " TCX trackpoint(s) without Time\n";

  out.summary["time_timer"] = timer_total;
  out.summary["distance_total"] = distance_total;
  out.summary["calories_total"] = calories_total;
  return out;
}

// ===== GPX =====

DecodedActivity GpxDecoder::decode(const std::string &bytes) const {
  pugi::xml_document doc;
  load(doc, bytes, "GPX");
  pugi::xml_node root = child(doc, "gpx");
  if (!root)
    throw DecodeError("not a GPX document");

  pugi::xml_node trk;
  int n_tracks = 0;
  for (pugi::xml_node c : root.children()) {
    if (std::strcmp(local_name(c.name()), "trk") == 0) {
      trk = c;
      ++n_tracks;
    }
  }
  if (n_tracks == 0)
    throw DecodeError("GPX document holds no trk");
  if (n_tracks > 1)
    throw NotSupportedError("GPX document holds more than one trk");

  DecodedActivity out;
  canonical_units(out.records);
  if (pugi::xml_node t = child(child(root, "metadata"), "time"))
    out.summary["timestamp_start"] = parse_iso8601(t.child_value());
  if (pugi::xml_node name = child(trk, "name"))
    out.summary["name"] = name.child_value();
  if (pugi::xml_node type = child(trk, "type"))
    out.summary["sport"] = type.child_value();
  if (pugi::xml_attribute creator = root.attribute("creator"))
    out.summary["device"] = creator.value();

  std::size_t skipped = 0;
  for (pugi::xml_node seg : trk.children()) {
    if (std::strcmp(local_name(seg.name()), "trkseg") != 0)
      continue;
    const std::size_t first = out.records.samples.size();
    for (pugi::xml_node pt : seg.children()) {
      if (std::strcmp(local_name(pt.name()), "trkpt") != 0)
        continue;
      pugi::xml_node time = child(pt, "time");
      if (!time) {
        ++skipped;
        continue;
      }
      Sample s;
      s.timestamp = parse_iso8601(time.child_value());
      if (auto v = number_attr(pt, "lat"))
        s.set(Field::Latitude, *v);
      if (auto v = number_attr(pt, "lon"))
        s.set(Field::Longitude, *v);
      if (auto v = number(child(pt, "ele")))
        s.set(Field::Elevation, *v);

      pugi::xml_node ext = child(pt, "extensions");
      if (auto v = number(descendant(ext, "hr")))
        s.set(Field::HeartRate, *v);
      if (auto v = number(descendant(ext, "cad")))
        s.set(Field::Cadence, *v);
      if (auto v = number(descendant(ext, "power")))
        s.set(Field::Power, *v);
      if (auto v = number(descendant(ext, "speed")))
        s.set(Field::Speed, *v);
      out.records.samples.push_back(s);
    }
    bracket(out, first);
  }
  if (skipped > 0)
    std::cerr << "[decode] skipped " << skipped
              << " GPX trkpt(s) without time\n";
  return out;
}
