#include "paper/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>

namespace paper {

namespace {

struct DoubleField {
  const char* name;
  double EngineConfig::*field;
};

struct IntField {
  const char* name;
  int EngineConfig::*field;
};

// Parameters governance may bound. Keep in sync with governableParameters().
constexpr DoubleField kDoubleFields[] = {
    {"kelly_fraction", &EngineConfig::kelly_fraction},
    {"max_trade_exposure", &EngineConfig::max_trade_exposure},
    {"min_edge", &EngineConfig::min_edge},
    {"min_odds", &EngineConfig::min_odds},
    {"min_stake", &EngineConfig::min_stake},
    {"stop_loss_pct", &EngineConfig::stop_loss_pct},
    {"take_profit_pct", &EngineConfig::take_profit_pct},
    {"max_market_exposure", &EngineConfig::max_market_exposure},
    {"averaging_price_drop", &EngineConfig::averaging_price_drop},
    {"averaging_min_edge_improvement",
     &EngineConfig::averaging_min_edge_improvement},
    {"drawdown_halt_threshold", &EngineConfig::drawdown_halt_threshold},
    {"drawdown_resume_threshold", &EngineConfig::drawdown_resume_threshold},
};

constexpr IntField kIntFields[] = {
    {"max_additions", &EngineConfig::max_additions},
    {"reversal_ticks", &EngineConfig::reversal_ticks},
};

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end()) {
    out = it->get<T>();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Name-based parameter access
// -----------------------------------------------------------------------------
std::optional<double> EngineConfig::parameter(const std::string& name) const {
  for (const auto& f : kDoubleFields) {
    if (name == f.name) {
      return this->*f.field;
    }
  }
  for (const auto& f : kIntFields) {
    if (name == f.name) {
      return static_cast<double>(this->*f.field);
    }
  }
  return std::nullopt;
}

bool EngineConfig::setParameter(const std::string& name, double value) {
  for (const auto& f : kDoubleFields) {
    if (name == f.name) {
      this->*f.field = value;
      return true;
    }
  }
  for (const auto& f : kIntFields) {
    if (name == f.name) {
      this->*f.field = static_cast<int>(std::lround(value));
      return true;
    }
  }
  return false;
}

const std::vector<std::string>& EngineConfig::governableParameters() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& f : kDoubleFields) out.emplace_back(f.name);
    for (const auto& f : kIntFields) out.emplace_back(f.name);
    return out;
  }();
  return names;
}

const char* drawdownRecoveryToString(DrawdownRecovery mode) {
  switch (mode) {
    case DrawdownRecovery::Hysteresis: return "hysteresis";
    case DrawdownRecovery::Cooldown:   return "cooldown";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// JSON mapping
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const EngineConfig& c) {
  j = nlohmann::json::object();
  j["initial_capital"] = c.initial_capital;
  for (const auto& f : kDoubleFields) {
    j[f.name] = c.*f.field;
  }
  for (const auto& f : kIntFields) {
    j[f.name] = c.*f.field;
  }
  j["drawdown_recovery"] = drawdownRecoveryToString(c.drawdown_recovery);
  j["drawdown_cooldown_ms"] = c.drawdown_cooldown_ms;
  j["slippage_base_rate"] = c.slippage_base_rate;
  j["slippage_impact"] = c.slippage_impact;
  j["slippage_liquidity_floor"] = c.slippage_liquidity_floor;
  j["slippage_min_rate"] = c.slippage_min_rate;
  j["slippage_max_rate"] = c.slippage_max_rate;
  j["journal_path"] = c.journal_path;
  j["snapshot_path"] = c.snapshot_path;
  j["journal_max_retries"] = c.journal_max_retries;
  j["journal_retry_backoff_ms"] = c.journal_retry_backoff_ms;
  j["worker_threads"] = c.worker_threads;
  j["sweep_interval_ms"] = c.sweep_interval_ms;
  j["reconcile_every_sweeps"] = c.reconcile_every_sweeps;
  j["signal_endpoint"] = c.signal_endpoint;
  j["ipc_cmd_endpoint"] = c.ipc_cmd_endpoint;
  j["ipc_pub_endpoint"] = c.ipc_pub_endpoint;
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
  readIfPresent(j, "initial_capital", c.initial_capital);
  for (const auto& f : kDoubleFields) {
    readIfPresent(j, f.name, c.*f.field);
  }
  for (const auto& f : kIntFields) {
    readIfPresent(j, f.name, c.*f.field);
  }

  std::string recovery;
  readIfPresent(j, "drawdown_recovery", recovery);
  if (recovery == "cooldown") {
    c.drawdown_recovery = DrawdownRecovery::Cooldown;
  } else if (recovery == "hysteresis") {
    c.drawdown_recovery = DrawdownRecovery::Hysteresis;
  } else if (!recovery.empty()) {
    throw std::invalid_argument("unknown drawdown_recovery: " + recovery);
  }

  readIfPresent(j, "drawdown_cooldown_ms", c.drawdown_cooldown_ms);
  readIfPresent(j, "slippage_base_rate", c.slippage_base_rate);
  readIfPresent(j, "slippage_impact", c.slippage_impact);
  readIfPresent(j, "slippage_liquidity_floor", c.slippage_liquidity_floor);
  readIfPresent(j, "slippage_min_rate", c.slippage_min_rate);
  readIfPresent(j, "slippage_max_rate", c.slippage_max_rate);
  readIfPresent(j, "journal_path", c.journal_path);
  readIfPresent(j, "snapshot_path", c.snapshot_path);
  readIfPresent(j, "journal_max_retries", c.journal_max_retries);
  readIfPresent(j, "journal_retry_backoff_ms", c.journal_retry_backoff_ms);
  readIfPresent(j, "worker_threads", c.worker_threads);
  readIfPresent(j, "sweep_interval_ms", c.sweep_interval_ms);
  readIfPresent(j, "reconcile_every_sweeps", c.reconcile_every_sweeps);
  readIfPresent(j, "signal_endpoint", c.signal_endpoint);
  readIfPresent(j, "ipc_cmd_endpoint", c.ipc_cmd_endpoint);
  readIfPresent(j, "ipc_pub_endpoint", c.ipc_pub_endpoint);
}

}  // namespace paper
