#include "http_handler.hpp"
#include "core/Activity.hpp"
#include "core/ActivityReport.hpp"
#include "core/PowerUtils.hpp"
#include "http/json_errors.hpp"
#include "io/ActivityDecoder.hpp"
#include "models/ActivityJson.hpp"
#include "models/Errors.hpp"

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

// tiny helpers for query parameters
static std::optional<double> param_double(const httplib::Request &req,
                                          const char *name) {
  if (!req.has_param(name))
    return std::nullopt;
  const std::string raw = req.get_param_value(name);
  size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(raw, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != raw.size())
    throw std::invalid_argument(std::string("query parameter '") + name +
                                "' is not a number: " + raw);
  return v;
}

static std::optional<bool> param_bool(const httplib::Request &req,
                                      const char *name) {
  if (!req.has_param(name))
    return std::nullopt;
  const std::string raw = req.get_param_value(name);
  if (raw == "true" || raw == "1")
    return true;
  if (raw == "false" || raw == "0")
    return false;
  throw std::invalid_argument(std::string("query parameter '") + name +
                              "' must be true or false");
}

static void reply_error(httplib::Response &res, int status, const char *kind,
                        const std::string &what) {
  json err = {{"ok", false}, {"kind", kind}, {"what", what}};
  res.status = status;
  res.set_content(err.dump(2), "application/json");
}

// ===== routes =====

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "analyze") {
    handleAnalyze(req, res);
  } else if (action == "validate") {
    handleValidate(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "health") {
    handleHealth(req, res);
  } else if (action == "formats") {
    handleFormats(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

ActivityParams
HttpHandler::params_from_query(const httplib::Request &req) const {
  ActivityParams p = defaults_;
  if (auto v = param_bool(req, "remove_stopped"))
    p.remove_stopped_periods = *v;
  if (auto v = param_double(req, "stopped_threshold"))
    p.stopped_threshold = *v;
  if (auto v = param_bool(req, "retain_excised"))
    p.retain_excised = *v;
  if (auto v = param_bool(req, "smooth_grade"))
    p.smooth_grade = *v;
  return p;
}

// ===== POST: /analyze =====
// Body: the raw activity file. Query: format=fit|tcx|gpx|json plus optional
// parameter overrides and thresholds.

void HttpHandler::handleAnalyze(const httplib::Request &req,
                                httplib::Response &res) {
  const std::string fmt_name =
      req.has_param("format") ? req.get_param_value("format") : "json";
  const auto format = FileFormatFromString(fmt_name);
  if (!format) {
    reply_error(res, 400, "bad_request", "unknown format: " + fmt_name);
    return;
  }

  ActivityParams params;
  ReportOptions opt;
  try {
    params = params_from_query(req);
    opt.threshold_power = param_double(req, "threshold_power");
    opt.threshold_heart_rate = param_double(req, "threshold_heart_rate");
    if (!opt.threshold_power && req.has_param("threshold_pace"))
      opt.threshold_power =
          power::flat_run_power(req.get_param_value("threshold_pace"));
    opt.include_rows = param_bool(req, "rows").value_or(false);
  } catch (const std::invalid_argument &e) {
    reply_error(res, 400, "bad_request", e.what());
    return;
  }

  try {
    DecodedActivity decoded;
    if (*format == FileFormat::Json) {
      // parse here so syntax errors can point at line and column
      json body;
      try {
        body = json::parse(req.body);
      } catch (const json::parse_error &e) {
        res.status = 400;
        res.set_content(parse_error_body(req.body, e).dump(2),
                        "application/json");
        return;
      }
      decoded = body.get<DecodedActivity>();
    } else {
      decoded = decode(req.body, *format);
    }

    Activity act(std::move(decoded), params, elevation_);
    json report = activity_report(act, opt);
    report["ok"] = true;
    res.set_content(report.dump(2), "application/json");
    std::cout << "[analyze] format=" << FileFormatToString(*format)
              << " rows=" << act.table().size()
              << " blocks=" << act.block_count() << "\n";
  } catch (const ActivityError &e) {
    std::cerr << "[analyze] rejected: " << e.what() << "\n";
    reply_error(res, 422, "activity_error", e.what());
  } catch (const json::exception &e) {
    reply_error(res, 400, "type_error", e.what());
  }
}

// ===== POST: /validate =====

void HttpHandler::handleValidate(const httplib::Request &req,
                                 httplib::Response &res) {
  try {
    auto body = json::parse(req.body);
    DecodedActivity decoded = body.get<DecodedActivity>();
    json ok = {{"ok", true},
               {"samples", decoded.records.samples.size()},
               {"events", decoded.events.size()},
               {"laps", decoded.laps.size()}};
    res.set_content(ok.dump(), "application/json");
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_body(req.body, e).dump(2),
                    "application/json");
  } catch (const DecodeError &e) {
    reply_error(res, 400, "decode_error", e.what());
  } catch (const json::exception &e) {
    reply_error(res, 400, "type_error", e.what());
  }
}

// ===== GET =====

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  json ok = {{"ok", true},
             {"elevation_service", elevation_ != nullptr},
             {"defaults",
              {{"remove_stopped_periods", defaults_.remove_stopped_periods},
               {"stopped_threshold", defaults_.stopped_threshold},
               {"retain_excised", defaults_.retain_excised},
               {"smooth_grade", defaults_.smooth_grade}}}};
  res.set_content(ok.dump(), "application/json");
}

void HttpHandler::handleFormats(const httplib::Request &,
                                httplib::Response &res) {
  json out = json::array();
  for (FileFormat f : {FileFormat::Fit, FileFormat::Tcx, FileFormat::Gpx,
                       FileFormat::Json})
    out.push_back(FileFormatToString(f));
  res.set_content(json{{"formats", out}}.dump(), "application/json");
}
