#include "paper/config/config_store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace paper {

namespace {

nlohmann::json readJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("cannot parse " + path + ": " + e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// File loaders
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  nlohmann::json j = readJsonFile(path);
  try {
    return j.get<EngineConfig>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("invalid engine config " + path + ": " +
                             e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("invalid engine config " + path + ": " +
                             e.what());
  }
}

GovernanceBounds loadGovernanceBounds(const std::string& path) {
  nlohmann::json j = readJsonFile(path);
  try {
    return j.get<GovernanceBounds>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("invalid governance bounds " + path + ": " +
                             e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("invalid governance bounds " + path + ": " +
                             e.what());
  }
}

// -----------------------------------------------------------------------------
// Constructor: clamp and publish the initial configuration
// -----------------------------------------------------------------------------
ConfigStore::ConfigStore(EngineConfig config, GovernanceBounds bounds,
                         std::string config_path, std::string bounds_path)
    : config_path_(std::move(config_path)),
      bounds_path_(std::move(bounds_path)),
      bounds_(std::move(bounds)) {
  std::lock_guard lock(write_mutex_);
  publishLocked(std::move(config));
}

std::shared_ptr<const EngineConfig> ConfigStore::snapshot() const {
  return std::atomic_load(&effective_);
}

GovernanceBounds ConfigStore::bounds() const {
  std::lock_guard lock(write_mutex_);
  return bounds_;
}

std::vector<BoundViolation> ConfigStore::lastViolations() const {
  std::lock_guard lock(write_mutex_);
  return last_violations_;
}

std::vector<BoundViolation> ConfigStore::update(EngineConfig config) {
  std::lock_guard lock(write_mutex_);
  publishLocked(std::move(config));
  return last_violations_;
}

// -----------------------------------------------------------------------------
// reload(): re-read both files; keep the current snapshot on failure
// -----------------------------------------------------------------------------
Result<std::vector<BoundViolation>> ConfigStore::reload() {
  std::lock_guard lock(write_mutex_);

  EngineConfig config = raw_;
  GovernanceBounds bounds = bounds_;
  try {
    if (!config_path_.empty()) {
      config = loadEngineConfig(config_path_);
    }
    if (!bounds_path_.empty()) {
      bounds = loadGovernanceBounds(bounds_path_);
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "[ConfigStore] reload failed, keeping current config: "
              << e.what() << "\n";
    return makeError(ErrorKind::InvalidConfig, e.what());
  }

  bounds_ = std::move(bounds);
  publishLocked(std::move(config));

  std::cout << "[ConfigStore] reloaded. kelly_fraction="
            << effective_->kelly_fraction
            << " min_edge=" << effective_->min_edge
            << " clamped=" << last_violations_.size() << "\n";
  return last_violations_;
}

// -----------------------------------------------------------------------------
// publishLocked(): clamp a copy and swap it in atomically
// -----------------------------------------------------------------------------
void ConfigStore::publishLocked(EngineConfig config) {
  raw_ = config;
  last_violations_ = bounds_.clamp(config);
  std::atomic_store(&effective_,
                    std::shared_ptr<const EngineConfig>(
                        std::make_shared<EngineConfig>(std::move(config))));
}

}  // namespace paper
