#pragma once

#include "paper/domain/position.hpp"

#include <cstddef>
#include <vector>

namespace paper {

class PositionStore;

struct PerformanceSummary {
  std::size_t closed{0};
  std::size_t wins{0};
  std::size_t losses{0};
  double win_rate{0.0};        // wins / closed, 0 when nothing closed
  double gross_profit{0.0};
  double gross_loss{0.0};      // positive number
  double profit_factor{0.0};   // gross_profit / gross_loss, 0 if no data
  double total_realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// ReportingExport - read-only performance view for external analytics
// -----------------------------------------------------------------------------
//
// @brief  Returns the closed-position history and aggregates it into a
//         PerformanceSummary. Never touches live state beyond a copy.
//
// @details
// A win is realized_pnl > 0, a loss realized_pnl < 0; break-even trades
// count as closed but neither. profit_factor is gross_profit / gross_loss;
// with profits and no losses it is reported as gross_profit (there is no
// finite ratio), with no trades as 0.
// -----------------------------------------------------------------------------
class ReportingExport {
 public:
  static std::vector<domain::Position> closedPositions(
      const PositionStore& store);

  static PerformanceSummary summarize(
      const std::vector<domain::Position>& closed);
};

}  // namespace paper
