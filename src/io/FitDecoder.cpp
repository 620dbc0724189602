// FitDecoder hands the byte stream to fit::Decode and gathers the messages it
// broadcasts into a DecodedActivity.

#include "io/FitDecoder.hpp"
#include "io/TimeUtil.hpp"
#include "models/Errors.hpp"

#include "fit_decode.hpp"
#include "fit_event_mesg.hpp"
#include "fit_event_mesg_listener.hpp"
#include "fit_lap_mesg.hpp"
#include "fit_lap_mesg_listener.hpp"
#include "fit_mesg_broadcaster.hpp"
#include "fit_record_mesg.hpp"
#include "fit_record_mesg_listener.hpp"
#include "fit_session_mesg.hpp"
#include "fit_session_mesg_listener.hpp"

#include <iostream>
#include <sstream>

namespace {

double to_unix(FIT_DATE_TIME t) { return t + kFitEpochOffset; }

// Session and lap messages share their statistics fields.
template <typename Mesg> Json totals(Mesg &m) {
  Json out = Json::object();
  if (m.IsStartTimeValid())
    out["timestamp_start"] = to_unix(m.GetStartTime());
  if (m.IsTimestampValid())
    out["timestamp_end"] = to_unix(m.GetTimestamp());
  if (m.IsTotalElapsedTimeValid())
    out["time_elapsed"] = m.GetTotalElapsedTime();
  if (m.IsTotalTimerTimeValid())
    out["time_timer"] = m.GetTotalTimerTime();
  if (m.IsTotalDistanceValid())
    out["distance_total"] = m.GetTotalDistance();
  if (m.IsTotalCaloriesValid())
    out["calories_total"] = m.GetTotalCalories();
  if (m.IsEnhancedAvgSpeedValid())
    out["speed_avg"] = m.GetEnhancedAvgSpeed();
  else if (m.IsAvgSpeedValid())
    out["speed_avg"] = m.GetAvgSpeed();
  if (m.IsEnhancedMaxSpeedValid())
    out["speed_max"] = m.GetEnhancedMaxSpeed();
  else if (m.IsMaxSpeedValid())
    out["speed_max"] = m.GetMaxSpeed();
  if (m.IsAvgHeartRateValid())
    out["heart_rate_avg"] = m.GetAvgHeartRate();
  if (m.IsMaxHeartRateValid())
    out["heart_rate_max"] = m.GetMaxHeartRate();
  if (m.IsAvgCadenceValid())
    out["cadence_avg"] = m.GetAvgCadence();
  if (m.IsAvgPowerValid())
    out["power_avg"] = m.GetAvgPower();
  if (m.IsMaxPowerValid())
    out["power_max"] = m.GetMaxPower();
  if (m.IsTotalAscentValid())
    out["elevation_gain"] = m.GetTotalAscent();
  if (m.IsTotalDescentValid())
    out["elevation_loss"] = m.GetTotalDescent();
  return out;
}

class FitCollector : public fit::RecordMesgListener,
                     public fit::EventMesgListener,
                     public fit::SessionMesgListener,
                     public fit::LapMesgListener {
public:
  DecodedActivity out;
  int sessions = 0;
  std::size_t untimed_records = 0;

  FitCollector() {
    out.records.units = {{Field::Latitude, "semicircles"},
                         {Field::Longitude, "semicircles"},
                         {Field::Speed, "m/s"},
                         {Field::Elevation, "m"},
                         {Field::Distance, "m"},
                         {Field::HeartRate, "bpm"},
                         {Field::Cadence, "rpm"},
                         {Field::Power, "W"}};
  }

  void OnMesg(fit::RecordMesg &m) override {
    if (!m.IsTimestampValid()) {
      ++untimed_records;
      return;
    }
    Sample s;
    s.timestamp = to_unix(m.GetTimestamp());
    if (m.IsPositionLatValid() && m.IsPositionLongValid()) {
      s.set(Field::Latitude, m.GetPositionLat());
      s.set(Field::Longitude, m.GetPositionLong());
    }
    // enhanced fields win over their 16-bit counterparts
    if (m.IsEnhancedAltitudeValid())
      s.set(Field::Elevation, m.GetEnhancedAltitude());
    else if (m.IsAltitudeValid())
      s.set(Field::Elevation, m.GetAltitude());
    if (m.IsEnhancedSpeedValid())
      s.set(Field::Speed, m.GetEnhancedSpeed());
    else if (m.IsSpeedValid())
      s.set(Field::Speed, m.GetSpeed());
    if (m.IsHeartRateValid())
      s.set(Field::HeartRate, m.GetHeartRate());
    if (m.IsCadenceValid())
      s.set(Field::Cadence, m.GetCadence());
    if (m.IsDistanceValid())
      s.set(Field::Distance, m.GetDistance());
    if (m.IsPowerValid())
      s.set(Field::Power, m.GetPower());
    out.records.samples.push_back(s);
  }

  // timer events only
  void OnMesg(fit::EventMesg &m) override {
    if (!m.IsEventValid() || m.GetEvent() != FIT_EVENT_TIMER ||
        !m.IsEventTypeValid() || !m.IsTimestampValid())
      return;

    Event e;
    e.timestamp = to_unix(m.GetTimestamp());
    e.provenance = EventProvenance::Device;
    switch (m.GetEventType()) {
    case FIT_EVENT_TYPE_START:
      e.kind = EventKind::Start;
      e.type = "start";
      break;
    case FIT_EVENT_TYPE_STOP:
      e.kind = EventKind::Stop;
      e.type = "stop";
      break;
    case FIT_EVENT_TYPE_STOP_ALL:
      e.kind = EventKind::Stop;
      e.type = "stop_all";
      break;
    case FIT_EVENT_TYPE_STOP_DISABLE:
      e.kind = EventKind::Stop;
      e.type = "stop_disable";
      break;
    case FIT_EVENT_TYPE_STOP_DISABLE_ALL:
      e.kind = EventKind::Stop;
      e.type = "stop_disable_all";
      break;
    default:
      return;
    }
    out.events.push_back(e);
  }

  void OnMesg(fit::SessionMesg &m) override {
    if (++sessions > 1)
      return;
    out.summary = totals(m);
    if (m.IsSportValid())
      out.summary["sport"] = static_cast<int>(m.GetSport());
  }

  void OnMesg(fit::LapMesg &m) override { out.laps.push_back(totals(m)); }
};

} // namespace

DecodedActivity FitDecoder::decode(const std::string &bytes) const {
  std::istringstream file(bytes, std::ios::in | std::ios::binary);
  fit::Decode decode;

  if (!decode.IsFIT(file))
    throw DecodeError("not a FIT file (missing .FIT signature)");
  file.clear();
  file.seekg(0);
  if (!decode.CheckIntegrity(file))
    throw DecodeError("FIT file failed its integrity check (size or CRC)");
  file.clear();
  file.seekg(0);

  fit::MesgBroadcaster broadcaster;
  FitCollector collector;
  broadcaster.AddListener(static_cast<fit::RecordMesgListener &>(collector));
  broadcaster.AddListener(static_cast<fit::EventMesgListener &>(collector));
  broadcaster.AddListener(static_cast<fit::SessionMesgListener &>(collector));
  broadcaster.AddListener(static_cast<fit::LapMesgListener &>(collector));

  try {
    if (!decode.Read(file, broadcaster, broadcaster))
      throw DecodeError("FIT decode stopped before the end of the file");
  } catch (const fit::RuntimeException &e) {
    throw DecodeError(std::string("FIT decode error: ") + e.what());
  }

  if (collector.sessions > 1)
    throw NotSupportedError("FIT file holds " +
                            std::to_string(collector.sessions) + " sessions");
  if (collector.untimed_records > 0)
    std::cerr << "[decode] skipped " << collector.untimed_records
              << " FIT record(s) without a timestamp\n";
  return std::move(collector.out);
}
