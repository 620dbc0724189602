#pragma once

#include "core/ElevationService.hpp"
#include "httplib.h"
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Thin wrapper around httplib callbacks. The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  explicit HttpHandler(ActivityParams defaults,
                       const ElevationService *elevation = nullptr)
      : defaults_(defaults), elevation_(elevation) {}

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

private:
  ActivityParams defaults_;
  const ElevationService *elevation_;

  // Individual request handlers
  void handleAnalyze(const httplib::Request &req, httplib::Response &res);
  void handleValidate(const httplib::Request &req, httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);
  void handleFormats(const httplib::Request &req, httplib::Response &res);

  ActivityParams params_from_query(const httplib::Request &req) const;
};
