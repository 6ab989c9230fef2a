#pragma once

#include "paper/domain/capital.hpp"
#include "paper/domain/position.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace paper {

// External capital added to the ledger (including the initial capital).
struct DepositRecord {
  double amount{0.0};
};

// Capital moved from available to allocated for a position.
struct ReservationRecord {
  domain::TokenId token_id{0};
  std::uint64_t position_id{0};
  std::string market_id;
  double amount{0.0};
  domain::ReservationReason reason{domain::ReservationReason::Open};
};

// A reservation redeemed with its share of the realized PnL.
struct ReleaseRecord {
  domain::TokenId token_id{0};
  std::uint64_t position_id{0};
  std::string market_id;
  double amount{0.0};
  double realized_pnl{0.0};
  domain::CloseReason close_reason{domain::CloseReason::None};
};

enum class TransitionKind {
  Opened,
  AveragedDown,
  ClosingStarted,
  Closed,
  Evaluated,
};

// Lifecycle step, carrying the full position as it stood afterwards.
struct TransitionRecord {
  TransitionKind kind{TransitionKind::Opened};
  domain::Position position;
};

using RecordBody =
    std::variant<DepositRecord, ReservationRecord, ReleaseRecord,
                 TransitionRecord>;

// -----------------------------------------------------------------------------
// JournalRecord - one line of the journal
// -----------------------------------------------------------------------------
//
// @brief  Sequence number, wall-clock timestamp and one of the closed set
//         of record bodies.
//
// @details
// On disk each record is a single JSON object:
//
//   {"seq":12,"ts_ms":1700000000000,"type":"RESERVE","token_id":4,...}
//
// type is one of DEPOSIT, RESERVE, RELEASE, TRANSITION. The body fields
// sit next to seq/ts_ms; a transition nests the position under
// "position". Parsing throws nlohmann::json::exception (or
// std::invalid_argument for unknown enum text); readers catch and count.
//
// Thread model:
//   Value type.
// -----------------------------------------------------------------------------
struct JournalRecord {
  std::uint64_t sequence{0};
  std::int64_t timestamp_ms{0};
  RecordBody body;
};

const char* transitionKindToString(TransitionKind kind);
bool parseTransitionKind(const std::string& text, TransitionKind& out);

// Short record type tag ("DEPOSIT", "RESERVE", ...).
const char* recordTypeName(const RecordBody& body);

void to_json(nlohmann::json& j, const JournalRecord& record);
void from_json(const nlohmann::json& j, JournalRecord& record);

}  // namespace paper

namespace paper {
namespace domain {

// Position <-> JSON, shared by the journal and IPC telemetry.
void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

}  // namespace domain
}  // namespace paper
