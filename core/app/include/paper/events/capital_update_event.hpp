#pragma once

#include "paper/domain/capital.hpp"

#include <cstdint>
#include <string>

namespace paper {

// Ledger state after a committed reservation, release or deposit.
struct CapitalUpdateEvent {
  domain::CapitalSnapshot capital{};
  std::string cause;  // "RESERVE", "RELEASE", "DEPOSIT", "ROLLBACK"
  std::string market_id;
  std::int64_t timestamp_ms{0};
};

}  // namespace paper
