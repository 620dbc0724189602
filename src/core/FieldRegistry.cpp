#include "core/FieldRegistry.hpp"
#include "core/Activity.hpp"
#include "models/Units.hpp"
#include <limits>
#include <stdexcept>

static const std::vector<double> *column_values(const Activity &act, Field f) {
  const Column *c = act.table().column(f);
  return c ? &c->values : nullptr;
}

static std::optional<double> number_at(const Json &obj, const std::string &key) {
  if (!obj.is_object())
    return std::nullopt;
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number())
    return std::nullopt;
  return it->get<double>();
}

// Build an explicit list of getters by short name
FieldRegistry::FieldRegistry() {
  for (Field f : kAllFields) {
    const std::string name = FieldToString(f);
    accessors_[name] = {name, CanonicalUnit(f),
                        [f](const Activity &a) { return column_values(a, f); }};
  }
  accessors_["time"] = {"time", "s", [](const Activity &a) {
                          return a.table().empty() ? nullptr
                                                   : &a.table().offset;
                        }};
  accessors_["timestamp"] = {"timestamp", "s", [](const Activity &a) {
                               return a.table().empty() ? nullptr
                                                        : &a.table().timestamp;
                             }};
  accessors_["grade"] = {"grade", "",
                         [](const Activity &a) { return a.grade(); }};
  accessors_["run_power"] = {"run_power", "W/kg",
                             [](const Activity &a) { return a.run_power(); }};
}

const FieldAccessor *FieldRegistry::find(const std::string &name) const {
  auto it = accessors_.find(name);
  return it == accessors_.end() ? nullptr : &it->second;
}

std::vector<std::string> FieldRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(accessors_.size());
  for (const auto &kv : accessors_)
    out.push_back(kv.first);
  return out;
}

bool FieldRegistry::has_stream(const Activity &act,
                               const std::string &name) const {
  const FieldAccessor *acc = find(name);
  return acc && acc->stream(act) != nullptr;
}

const std::vector<double> *
FieldRegistry::stream(const Activity &act, const std::string &name) const {
  const FieldAccessor *acc = find(name);
  if (!acc)
    throw std::out_of_range("unknown field: " + name);
  return acc->stream(act);
}

std::optional<double> FieldRegistry::summary(const Activity &act,
                                             const std::string &name,
                                             const std::string &stat) const {
  if (auto v = number_at(act.summary(), name + "_" + stat))
    return v;
  return number_at(act.summary(), stat + "_" + name);
}

std::vector<double> FieldRegistry::laps(const Activity &act,
                                        const std::string &name,
                                        const std::string &stat) const {
  std::vector<double> out;
  out.reserve(act.laps().size());
  for (const auto &lap : act.laps()) {
    auto v = number_at(lap, name + "_" + stat);
    out.push_back(v ? *v : std::numeric_limits<double>::quiet_NaN());
  }
  return out;
}
