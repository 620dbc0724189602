#pragma once
#include "models/CoreTypes.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

class Activity;

// Reads (or derives and caches) one per-row series of an Activity.
// Returns nullptr when the activity cannot provide it.
using StreamGetter =
    std::function<const std::vector<double> *(const Activity &)>;

struct FieldAccessor {
  std::string name;
  std::string unit;
  StreamGetter stream;
};

// Explicit name -> accessor table, built once per Activity. Besides the
// per-row streams it gives access to the "<field>_<stat>" entries of the
// activity summary and of each lap.
class FieldRegistry {
public:
  FieldRegistry();

  const FieldAccessor *find(const std::string &name) const;
  std::vector<std::string> names() const;

  bool has_stream(const Activity &act, const std::string &name) const;
  // Throws std::out_of_range for a name that is not registered.
  const std::vector<double> *stream(const Activity &act,
                                    const std::string &name) const;

  std::optional<double> summary(const Activity &act, const std::string &name,
                                const std::string &stat) const;
  // One entry per lap, NaN where the lap lacks the statistic.
  std::vector<double> laps(const Activity &act, const std::string &name,
                           const std::string &stat) const;

private:
  std::map<std::string, FieldAccessor> accessors_;
};
