#pragma once
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/Activity.hpp"

// ------- Small helpers -------
inline std::string fmt_opt(const std::optional<double> &v, int precision = 2) {
  if (!v)
    return "n/a";
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << *v;
  return os.str();
}

inline void print_column_stats(const std::string &name, const std::string &unit,
                               const std::vector<double> &y) {
  const std::size_t n = y.size();
  double ymin = std::numeric_limits<double>::infinity();
  double ymax = -std::numeric_limits<double>::infinity();
  double sum = 0.0;
  std::size_t nfinite = 0, nnan = 0, ninf = 0;

  for (double v : y) {
    if (std::isnan(v)) {
      nnan++;
      continue;
    }
    if (!std::isfinite(v)) {
      ninf++;
      continue;
    }
    ymin = std::min(ymin, v);
    ymax = std::max(ymax, v);
    sum += v;
    nfinite++;
  }
  double mean =
      nfinite ? (sum / nfinite) : std::numeric_limits<double>::quiet_NaN();

  std::cout << "  [" << name << "] unit=" << (unit.empty() ? "-" : unit)
            << "  rows=" << n << "\n"
            << "      y{min=" << ymin << ", max=" << ymax << ", mean=" << mean
            << ", nan=" << nnan << ", inf=" << ninf << "}\n";
}

// Per-block row counts and durations, then every registered stream.
inline void print_activity(const Activity &act) {
  const CanonicalTable &t = act.table();
  std::cout << "rows=" << t.size() << "  blocks=" << act.block_count()
            << "  excised=" << act.excised_count() << "\n"
            << "elapsed=" << act.elapsed_time()
            << " s  moving=" << act.moving_time() << " s\n";

  std::size_t i = 0;
  while (i < t.size()) {
    std::size_t j = i;
    while (j + 1 < t.size() && t.block[j + 1] == t.block[i])
      ++j;
    std::cout << "  block " << t.block[i] << ": rows=" << (j - i + 1)
              << "  offset " << t.offset[i] << " .. " << t.offset[j] << " s\n";
    i = j + 1;
  }

  for (const auto &name : act.fields().names()) {
    const FieldAccessor *acc = act.fields().find(name);
    if (const auto *s = acc->stream(act))
      print_column_stats(name, acc->unit, *s);
  }
}
