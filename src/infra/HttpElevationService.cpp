// HttpElevationService queries a remote elevation API in fixed-size batches.

#include "HttpElevationService.hpp"
#include "httplib.h"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// Split "http://host:port/path" into base and path
HttpElevationService::HttpElevationService(const std::string &url,
                                           std::size_t batch_size,
                                           int timeout_s)
    : batch_size_(batch_size == 0 ? 500 : batch_size), timeout_s_(timeout_s) {
  std::size_t host_start = 0;
  if (auto pos = url.find("://"); pos != std::string::npos)
    host_start = pos + 3;
  if (auto p = url.find('/', host_start); p != std::string::npos) {
    base_ = url.substr(0, p);
    path_ = url.substr(p);
  } else {
    base_ = url;
    path_ = "/";
  }
  if (base_.size() <= host_start)
    throw std::runtime_error("elevation service url has no host: " + url);
}

std::vector<double>
HttpElevationService::lookup(const std::vector<Coordinate> &coords) const {
  std::vector<double> out;
  out.reserve(coords.size());
  for (std::size_t i = 0; i < coords.size(); i += batch_size_) {
    const std::size_t n = std::min(batch_size_, coords.size() - i);
    auto part = lookup_batch(coords.data() + i, n);
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

std::vector<double>
HttpElevationService::lookup_batch(const Coordinate *first,
                                   std::size_t count) const {
  json body;
  body["locations"] = json::array();
  for (std::size_t i = 0; i < count; ++i)
    body["locations"].push_back(
        {{"latitude", first[i].lat}, {"longitude", first[i].lon}});

  httplib::Client cli(base_);
  cli.set_connection_timeout(timeout_s_, 0);
  cli.set_read_timeout(timeout_s_, 0);
  auto res = cli.Post(path_, body.dump(), "application/json");
  if (!res)
    throw std::runtime_error("elevation request failed: " +
                             httplib::to_string(res.error()));
  if (res->status != 200)
    throw std::runtime_error("elevation service returned HTTP " +
                             std::to_string(res->status));

  json reply = json::parse(res->body);
  const auto &results = reply.at("results");
  if (!results.is_array() || results.size() != count)
    throw std::runtime_error("elevation service returned " +
                             std::to_string(results.size()) + " results for " +
                             std::to_string(count) + " locations");

  std::vector<double> out;
  out.reserve(count);
  for (const auto &r : results)
    out.push_back(r.at("elevation").get<double>());
  return out;
}
