#pragma once

#include "paper/config/engine_config.hpp"
#include "paper/config/governance_bounds.hpp"
#include "paper/domain/result.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace paper {

// -----------------------------------------------------------------------------
// File loaders
// -----------------------------------------------------------------------------
// Both throw std::runtime_error when the file cannot be opened or parsed.
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);
GovernanceBounds loadGovernanceBounds(const std::string& path);

// -----------------------------------------------------------------------------
// ConfigStore - publishes the effective (bounds-clamped) configuration
// -----------------------------------------------------------------------------
//
// @brief  Owns the raw EngineConfig and GovernanceBounds and hands out an
//         immutable, clamped snapshot to every sizing and evaluation step.
//
// @details
// The effective config is a std::shared_ptr<const EngineConfig> swapped
// with std::atomic_store. A worker that called snapshot() keeps reading the
// same values for the whole operation even if a reload lands halfway
// through; there are no torn reads across parameters.
//
// update() and reload() are the only writers. reload() re-reads both files
// from the paths given at construction and is triggered explicitly (the
// IPC RELOAD command), never by the engine on its own.
//
// Thread model:
//   snapshot() is lock-free and safe from any thread. update()/reload() are
//   serialized by write_mutex_.
//
// Ownership:
//   Owned by main() (or a test) and passed by reference to PaperEngine and
//   Simulator.
// -----------------------------------------------------------------------------
class ConfigStore {
 public:
  explicit ConfigStore(EngineConfig config,
                       GovernanceBounds bounds = GovernanceBounds{},
                       std::string config_path = "",
                       std::string bounds_path = "");

  ConfigStore(const ConfigStore&) = delete;
  ConfigStore& operator=(const ConfigStore&) = delete;

  // Current effective configuration. Never null.
  std::shared_ptr<const EngineConfig> snapshot() const;

  GovernanceBounds bounds() const;

  // Parameters clamped by the most recent publish (construction, update or
  // reload).
  std::vector<BoundViolation> lastViolations() const;

  // Clamps `config` against the current bounds and publishes it. Returns
  // the parameters that had to be clamped.
  std::vector<BoundViolation> update(EngineConfig config);

  // -------------------------------------------------------------------------
  // reload()
  // -------------------------------------------------------------------------
  // @brief  Re-reads the config and bounds files and publishes the result.
  //
  // @return The clamped parameters on success. If either file cannot be
  //         read, an InvalidConfig error; the current snapshot stays in
  //         place.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  Result<std::vector<BoundViolation>> reload();

  const std::string& configPath() const { return config_path_; }
  const std::string& boundsPath() const { return bounds_path_; }

 private:
  void publishLocked(EngineConfig config);

  std::string config_path_;
  std::string bounds_path_;

  mutable std::mutex write_mutex_;
  EngineConfig raw_;  // as loaded, before clamping
  GovernanceBounds bounds_;
  std::vector<BoundViolation> last_violations_;

  // Read with std::atomic_load, written with std::atomic_store.
  std::shared_ptr<const EngineConfig> effective_;
};

}  // namespace paper
