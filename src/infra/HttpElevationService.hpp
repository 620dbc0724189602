#pragma once
#include "core/ElevationService.hpp"
#include <string>

// Open-Elevation style client:
//   POST {"locations":[{"latitude":..,"longitude":..}, ...]}
//   -> {"results":[{"elevation":..}, ...]}
class HttpElevationService final : public ElevationService {
public:
  // `url` is "http://host[:port]/path"
  explicit HttpElevationService(const std::string &url,
                                std::size_t batch_size = 500,
                                int timeout_s = 30);

  std::vector<double>
  lookup(const std::vector<Coordinate> &coords) const override;

private:
  std::string base_; // scheme://host:port
  std::string path_;
  std::size_t batch_size_;
  int timeout_s_;

  std::vector<double> lookup_batch(const Coordinate *first,
                                   std::size_t count) const;
};
