#include "paper/reporting/reporting_export.hpp"
#include "paper/positions/position_store.hpp"

namespace paper {

std::vector<domain::Position> ReportingExport::closedPositions(
    const PositionStore& store) {
  return store.closedPositions();
}

PerformanceSummary ReportingExport::summarize(
    const std::vector<domain::Position>& closed) {
  PerformanceSummary s;
  s.closed = closed.size();

  for (const auto& pos : closed) {
    s.total_realized_pnl += pos.realized_pnl;
    if (pos.realized_pnl > 0.0) {
      ++s.wins;
      s.gross_profit += pos.realized_pnl;
    } else if (pos.realized_pnl < 0.0) {
      ++s.losses;
      s.gross_loss -= pos.realized_pnl;
    }
  }

  if (s.closed > 0) {
    s.win_rate = static_cast<double>(s.wins) / static_cast<double>(s.closed);
  }
  if (s.gross_loss > 0.0) {
    s.profit_factor = s.gross_profit / s.gross_loss;
  } else {
    s.profit_factor = s.gross_profit;
  }
  return s;
}

}  // namespace paper
