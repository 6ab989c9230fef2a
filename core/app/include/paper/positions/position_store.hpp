#pragma once

#include "paper/concurrent/sequence_generator.hpp"
#include "paper/domain/capital.hpp"
#include "paper/domain/position.hpp"
#include "paper/domain/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace paper {

// Bounds on averaging down, taken from one EngineConfig snapshot.
struct AdditionLimits {
  int max_additions{1};
  double max_market_stake{0.0};  // absolute cap on cumulative stake
};

// -----------------------------------------------------------------------------
// PositionStore - owner of every paper position, live and historical
// -----------------------------------------------------------------------------
//
// @brief  Holds the active index (market id -> Position) and the closed
//         history, and enforces the lifecycle state machine of
//         domain::PositionStatus.
//
// @details
// One active position per market: beginOpening() refuses a market that
// already has a position in Opening, Open or Closing*. The position only
// leaves the active index when finalizeClose() moves it to history (or when
// abandonOpening() discards a failed Opening), so the market becomes
// eligible again exactly when the previous lifecycle is over.
//
// Every mutating operation checks its source state through
// canTransition(); a position can therefore be closed once only, and an
// addition can only land on an Open position.
//
// Averaging down (applyAddition):
//   new_entry  = (stake * entry + add * fill) / (stake + add)
//   contracts += add / fill
//   stake     += add
// bounded by AdditionLimits.
//
// PnL math (static helpers):
//   value(x)        = contracts * x
//   realized_pnl    = contracts * exit_price - stake
//   unrealized_pct  = (mark - entry_price) / entry_price
//
// The store never touches the ledger. The Simulator pairs each transition
// with the matching reserve/release and journals both.
//
// Thread model:
//   positions_mutex_ is a shared_mutex: writers take unique_lock, readers
//   (IPC STATUS, reports, sweep snapshot) take shared_lock. Callers hold
//   the per-market lock around multi-step sequences, so a read-then-write
//   on one market is never interleaved with another writer for the same
//   market.
//
// Ownership:
//   Owned by PaperEngine (or a test) and passed by reference to Simulator.
//   Returned Positions are copies.
// -----------------------------------------------------------------------------
class PositionStore {
 public:
  PositionStore() = default;

  PositionStore(const PositionStore&) = delete;
  PositionStore& operator=(const PositionStore&) = delete;
  PositionStore(PositionStore&&) = delete;
  PositionStore& operator=(PositionStore&&) = delete;

  // -------------------------------------------------------------------------
  // beginOpening(market_id, side, edge, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Creates a transient Opening position for the market.
  //
  // @return The new position, or DuplicateActivePosition if any
  //         non-terminal position exists for the market.
  // -------------------------------------------------------------------------
  Result<domain::Position> beginOpening(const std::string& market_id,
                                        domain::Side side, double edge,
                                        std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // confirmOpen(market_id, token, fill_price, resolution_at_ms)
  // -------------------------------------------------------------------------
  // @brief  Opening -> Open once capital for `token` is reserved and the
  //         reservation is durable. The token amount becomes the stake.
  // -------------------------------------------------------------------------
  Result<domain::Position> confirmOpen(const std::string& market_id,
                                       const domain::ReservationToken& token,
                                       double fill_price,
                                       std::int64_t resolution_at_ms);

  // Discards an Opening position (reservation failed). Returns false if
  // the market has no position in Opening.
  bool abandonOpening(const std::string& market_id);

  // -------------------------------------------------------------------------
  // applyAddition(market_id, token, fill_price, limits)
  // -------------------------------------------------------------------------
  // @brief  Open -> Open self-loop: adds token.amount at fill_price.
  //
  // @return Updated position; InvalidTransition if not Open; ExposureLimit
  //         if max_additions is reached or the cumulative stake would exceed
  //         limits.max_market_stake.
  // -------------------------------------------------------------------------
  Result<domain::Position> applyAddition(const std::string& market_id,
                                         const domain::ReservationToken& token,
                                         double fill_price,
                                         const AdditionLimits& limits);

  // Open -> Closing* for `reason`. InvalidTransition from any other state.
  Result<domain::Position> beginClosing(const std::string& market_id,
                                        domain::CloseReason reason);

  // -------------------------------------------------------------------------
  // finalizeClose(market_id, exit_price, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Closing* -> Closed. Books realized_pnl = contracts * exit_price
  //         - stake and moves the position into the closed history.
  //
  // @return The closed (now immutable) position.
  // -------------------------------------------------------------------------
  Result<domain::Position> finalizeClose(const std::string& market_id,
                                         double exit_price,
                                         std::int64_t now_ms);

  // Stores the outcome of a re-evaluation tick on an Open position.
  Result<domain::Position> recordEvaluation(const std::string& market_id,
                                            double last_edge, int streak);

  std::optional<domain::Position> find(const std::string& market_id) const;

  // Active positions ordered by position_id.
  std::vector<domain::Position> activePositions() const;

  // Closed positions in closing order.
  std::vector<domain::Position> closedPositions() const;

  std::size_t activeCount() const;

  // -------------------------------------------------------------------------
  // hydrate(active, closed)
  // -------------------------------------------------------------------------
  // @brief  Replaces the store's contents with journal-replayed state.
  //
  // @details
  // Recovery only, before worker threads start. Position ids issued later
  // are strictly greater than every hydrated id.
  // -------------------------------------------------------------------------
  void hydrate(std::vector<domain::Position> active,
               std::vector<domain::Position> closed);

  // Legal edges of the lifecycle graph.
  static bool canTransition(domain::PositionStatus from,
                            domain::PositionStatus to);

  static double realizedPnl(const domain::Position& pos, double exit_price);
  static double unrealizedPct(const domain::Position& pos, double mark);

  // -------------------------------------------------------------------------
  // Pure previews of the mutating steps
  // -------------------------------------------------------------------------
  // @brief  The position a step would produce, without touching the store.
  //
  // @details
  // The Simulator journals the preview first and applies the step after the
  // write is durable; confirmOpen(), applyAddition() and finalizeClose()
  // run the same functions, so the journaled snapshot and the stored
  // position are identical.
  // -------------------------------------------------------------------------
  static domain::Position withOpen(domain::Position opening,
                                   const domain::ReservationToken& token,
                                   double fill_price,
                                   std::int64_t resolution_at_ms);
  static domain::Position withAddition(domain::Position open,
                                       const domain::ReservationToken& token,
                                       double fill_price);
  static domain::Position withClose(domain::Position closing,
                                    double exit_price, std::int64_t now_ms);

  // ExposureLimit if adding `amount` to `pos` would break `limits`.
  static std::optional<Error> checkAddition(const domain::Position& pos,
                                            double amount,
                                            const AdditionLimits& limits);

 private:
  // Finds the active position for the market and checks that it may move
  // to `next`. On success `*out` points into active_.
  std::optional<Error> lookupForTransitionLocked(const std::string& market_id,
                                                 domain::PositionStatus next,
                                                 domain::Position** out);

  mutable std::shared_mutex positions_mutex_;

  std::unordered_map<std::string, domain::Position> active_;
  std::vector<domain::Position> closed_;

  SequenceGenerator position_ids_;
};

}  // namespace paper
