#pragma once

#include "paper/config/engine_config.hpp"

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <string>
#include <vector>

namespace paper {

// -----------------------------------------------------------------------------
// ParameterBound - governance range for one tunable
// -----------------------------------------------------------------------------
// step is the granularity governance proposals move in. A positive step
// makes the legal values min, min + step, ... up to max; clamp() snaps an
// in-range value to the nearest of them. Zero means any value in range.
// -----------------------------------------------------------------------------
struct ParameterBound {
  double min{0.0};
  double max{0.0};
  double step{0.0};
};

// One clamped parameter, reported as a GovernanceBoundViolation.
struct BoundViolation {
  std::string parameter;
  double requested{0.0};
  double applied{0.0};
  ParameterBound bound{};
};

// -----------------------------------------------------------------------------
// GovernanceBounds - externally owned ranges for tunable parameters
// -----------------------------------------------------------------------------
//
// @brief  Maps parameter name to {min, max, step}. Read at startup and on an
//         explicit reload; the engine never writes it back.
//
// @details
// clamp() forces every governed parameter of an EngineConfig into range and
// onto its step grid, and returns the list of adjustments. Such values are
// never an error: the effective value is the nearest legal one and a
// GovernanceBoundViolation is logged.
//
// Bounds for names EngineConfig does not know are kept (so they round-trip
// through STATUS) but have no effect.
//
// Thread model:
//   Value type. ConfigStore keeps the current copy behind its own lock.
// -----------------------------------------------------------------------------
class GovernanceBounds {
 public:
  GovernanceBounds() = default;

  // Defaults mirroring the governance ranges the self-improvement
  // collaborator is allowed to propose within.
  static GovernanceBounds defaults();

  void set(const std::string& name, ParameterBound bound);
  const ParameterBound* find(const std::string& name) const;
  bool empty() const { return bounds_.empty(); }
  const std::map<std::string, ParameterBound>& all() const { return bounds_; }

  // Clamps `config` in place; returns one entry per adjusted parameter.
  std::vector<BoundViolation> clamp(EngineConfig& config) const;

 private:
  std::map<std::string, ParameterBound> bounds_;
};

void to_json(nlohmann::json& j, const ParameterBound& bound);
void from_json(const nlohmann::json& j, ParameterBound& bound);
void to_json(nlohmann::json& j, const GovernanceBounds& bounds);
void from_json(const nlohmann::json& j, GovernanceBounds& bounds);

}  // namespace paper
