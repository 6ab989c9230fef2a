#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace paper {

// How the drawdown breaker decides that trading may resume.
enum class DrawdownRecovery {
  Hysteresis,  // drawdown back below drawdown_resume_threshold
  Cooldown,    // drawdown_cooldown_ms elapsed since the halt
};

// -----------------------------------------------------------------------------
// EngineConfig - every tunable the engine reads
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct holding sizing, risk, slippage, persistence
//         and runtime parameters.
//
// @details
// Loaded from JSON (config/engine.json). Missing keys keep the defaults
// below, so an empty object is a valid configuration. The numeric
// parameters that governance may tune are clamped into their
// GovernanceBounds by ConfigStore before any component sees them.
//
// Fractions are of capital (0.05 == 5 %). Percent thresholds are relative
// to cost basis or to the drawdown baseline.
//
// Thread model:
//   Value type. Components never hold a mutable reference: they take a
//   std::shared_ptr<const EngineConfig> snapshot from ConfigStore at the
//   start of each sizing or evaluation step.
// -----------------------------------------------------------------------------
struct EngineConfig {
  // --- Capital ----------------------------------------------------------------
  double initial_capital{5000.0};

  // --- Sizing -----------------------------------------------------------------
  double kelly_fraction{0.25};
  double max_trade_exposure{0.05};  // per-trade cap, fraction of available
  double min_edge{0.10};
  double min_odds{0.05};            // long-shot filter on market_price
  double min_stake{0.0};

  // --- Exits ------------------------------------------------------------------
  double stop_loss_pct{0.25};
  double take_profit_pct{0.25};

  // --- Averaging down ---------------------------------------------------------
  int max_additions{1};
  double max_market_exposure{0.10};  // cumulative per market, fraction of total
  double averaging_price_drop{0.10};
  double averaging_min_edge_improvement{0.05};

  // --- Edge reversal ----------------------------------------------------------
  int reversal_ticks{2};

  // --- Drawdown breaker -------------------------------------------------------
  double drawdown_halt_threshold{0.10};
  double drawdown_resume_threshold{0.05};
  DrawdownRecovery drawdown_recovery{DrawdownRecovery::Hysteresis};
  std::int64_t drawdown_cooldown_ms{3600000};

  // --- Slippage ---------------------------------------------------------------
  double slippage_base_rate{0.005};
  double slippage_impact{0.05};
  double slippage_liquidity_floor{100.0};
  double slippage_min_rate{0.002};
  double slippage_max_rate{0.10};

  // --- Journal ----------------------------------------------------------------
  std::string journal_path{"data/journal.jsonl"};
  std::string snapshot_path{"data/capital_snapshot.json"};
  int journal_max_retries{3};
  std::int64_t journal_retry_backoff_ms{10};

  // --- Runtime ----------------------------------------------------------------
  int worker_threads{4};
  std::int64_t sweep_interval_ms{1000};
  int reconcile_every_sweeps{30};

  // --- Network (empty endpoint disables the component) ------------------------
  std::string signal_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};

  // -------------------------------------------------------------------------
  // parameter(name) / setParameter(name, value)
  // -------------------------------------------------------------------------
  // @brief  Name-based access to the governable numeric parameters, used by
  //         GovernanceBounds to clamp values it has bounds for.
  //
  // @details
  // Integer parameters (max_additions, reversal_ticks) round to the nearest
  // integer on write. Unknown names return std::nullopt / false.
  // -------------------------------------------------------------------------
  std::optional<double> parameter(const std::string& name) const;
  bool setParameter(const std::string& name, double value);

  // Names accepted by parameter()/setParameter().
  static const std::vector<std::string>& governableParameters();
};

// JSON mapping (nlohmann ADL hooks). from_json keeps defaults for missing
// keys and throws nlohmann::json::exception on type mismatches.
void to_json(nlohmann::json& j, const EngineConfig& config);
void from_json(const nlohmann::json& j, EngineConfig& config);

const char* drawdownRecoveryToString(DrawdownRecovery mode);

}  // namespace paper
