#include "paper/config/governance_bounds.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace paper {

namespace {

// Values this close to a grid point count as on it.
constexpr double kGridTolerance = 1e-9;

// Nearest point of min + k * step, never above max. No-op without a step.
double snapToStep(double value, const ParameterBound& bound) {
  if (!(bound.step > 0.0)) {
    return value;
  }
  const double steps = std::round((value - bound.min) / bound.step);
  const double snapped = std::min(bound.min + steps * bound.step, bound.max);
  return std::abs(snapped - value) > kGridTolerance ? snapped : value;
}

}  // namespace

// -----------------------------------------------------------------------------
// defaults(): ranges the improvement agent may move parameters within
// -----------------------------------------------------------------------------
GovernanceBounds GovernanceBounds::defaults() {
  GovernanceBounds b;
  b.set("kelly_fraction", {0.10, 0.35, 0.05});
  b.set("min_edge", {0.08, 0.20, 0.02});
  b.set("min_odds", {0.05, 0.25, 0.02});
  b.set("max_trade_exposure", {0.01, 0.10, 0.01});
  b.set("max_market_exposure", {0.02, 0.20, 0.02});
  b.set("max_additions", {0, 3, 1});
  b.set("reversal_ticks", {1, 5, 1});
  return b;
}

void GovernanceBounds::set(const std::string& name, ParameterBound bound) {
  if (bound.min > bound.max) {
    throw std::invalid_argument("governance bound for " + name +
                                " has min > max");
  }
  bounds_[name] = bound;
}

const ParameterBound* GovernanceBounds::find(const std::string& name) const {
  auto it = bounds_.find(name);
  return it != bounds_.end() ? &it->second : nullptr;
}

// -----------------------------------------------------------------------------
// clamp(): force governed parameters into range and onto the step grid,
// never fail
// -----------------------------------------------------------------------------
std::vector<BoundViolation> GovernanceBounds::clamp(
    EngineConfig& config) const {
  std::vector<BoundViolation> violations;

  for (const auto& [name, bound] : bounds_) {
    auto current = config.parameter(name);
    if (!current) {
      continue;
    }

    const double applied =
        snapToStep(std::clamp(*current, bound.min, bound.max), bound);
    if (applied == *current) {
      continue;
    }

    config.setParameter(name, applied);
    violations.push_back(BoundViolation{name, *current, applied, bound});

    std::cerr << "[GovernanceBounds] GovernanceBoundViolation: " << name
              << "=" << *current << " outside [" << bound.min << ", "
              << bound.max << "] step " << bound.step << ", clamped to "
              << applied << "\n";
  }

  return violations;
}

// -----------------------------------------------------------------------------
// JSON mapping: { "kelly_fraction": {"min":0.1,"max":0.35,"step":0.05}, ... }
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const ParameterBound& b) {
  j = nlohmann::json{{"min", b.min}, {"max", b.max}, {"step", b.step}};
}

void from_json(const nlohmann::json& j, ParameterBound& b) {
  j.at("min").get_to(b.min);
  j.at("max").get_to(b.max);
  b.step = j.value("step", 0.0);
}

void to_json(nlohmann::json& j, const GovernanceBounds& bounds) {
  j = nlohmann::json::object();
  for (const auto& [name, bound] : bounds.all()) {
    j[name] = bound;
  }
}

void from_json(const nlohmann::json& j, GovernanceBounds& bounds) {
  bounds = GovernanceBounds{};
  for (auto it = j.begin(); it != j.end(); ++it) {
    bounds.set(it.key(), it.value().get<ParameterBound>());
  }
}

}  // namespace paper
