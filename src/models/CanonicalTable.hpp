#pragma once

#include "models/CoreTypes.hpp"
#include <cmath>
#include <map>
#include <string>
#include <vector>

// One measurement column. Nulls are NaN.
struct Column {
  std::string unit;
  std::vector<double> values;
};

// Retained samples in column form, keyed by (block, offset).
struct CanonicalTable {
  std::vector<int> block;
  std::vector<double> offset;    // s since first retained sample
  std::vector<double> timestamp; // absolute, s since epoch
  std::map<Field, Column> columns;
  std::vector<bool> excise; // only filled when excised rows are retained

  std::size_t size() const { return block.size(); }
  bool empty() const { return block.empty(); }

  bool has(Field f) const { return columns.count(f) > 0; }

  const Column *column(Field f) const {
    auto it = columns.find(f);
    return it == columns.end() ? nullptr : &it->second;
  }
  Column *column(Field f) {
    auto it = columns.find(f);
    return it == columns.end() ? nullptr : &it->second;
  }

  bool has_excise() const { return !excise.empty(); }
  bool excised(std::size_t i) const { return has_excise() && excise[i]; }

  int block_count() const {
    int n = 0;
    for (std::size_t i = 0; i < block.size(); ++i) {
      if (i == 0 || block[i] != block[i - 1])
        ++n;
    }
    return n;
  }
};
