#pragma once

#include "paper/time/i_time_provider.hpp"

namespace paper {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock ITimeProvider used by the paper_engine binary
// -----------------------------------------------------------------------------
// Thread model: stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace paper
