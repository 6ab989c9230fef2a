#include "paper/journal/journal_record.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace paper {

namespace {

domain::Side sideFrom(const nlohmann::json& j, const char* key) {
  domain::Side side;
  if (!domain::parseSide(j.at(key).get<std::string>(), side)) {
    throw std::invalid_argument(std::string("bad side in field ") + key);
  }
  return side;
}

domain::CloseReason closeReasonFrom(const nlohmann::json& j,
                                    const char* key) {
  domain::CloseReason reason;
  if (!domain::parseCloseReason(j.at(key).get<std::string>(), reason)) {
    throw std::invalid_argument(std::string("bad close reason in field ") +
                                key);
  }
  return reason;
}

domain::ReservationReason reservationReasonFrom(const nlohmann::json& j) {
  const auto text = j.at("reason").get<std::string>();
  if (text == "OPEN") {
    return domain::ReservationReason::Open;
  }
  if (text == "AVERAGE_DOWN") {
    return domain::ReservationReason::AverageDown;
  }
  throw std::invalid_argument("bad reservation reason " + text);
}

}  // namespace

// -----------------------------------------------------------------------------
// TransitionKind
// -----------------------------------------------------------------------------
const char* transitionKindToString(TransitionKind kind) {
  switch (kind) {
    case TransitionKind::Opened:         return "OPENED";
    case TransitionKind::AveragedDown:   return "AVERAGED_DOWN";
    case TransitionKind::ClosingStarted: return "CLOSING_STARTED";
    case TransitionKind::Closed:         return "CLOSED";
    case TransitionKind::Evaluated:      return "EVALUATED";
  }
  return "UNKNOWN";
}

bool parseTransitionKind(const std::string& text, TransitionKind& out) {
  for (auto kind : {TransitionKind::Opened, TransitionKind::AveragedDown,
                    TransitionKind::ClosingStarted, TransitionKind::Closed,
                    TransitionKind::Evaluated}) {
    if (text == transitionKindToString(kind)) {
      out = kind;
      return true;
    }
  }
  return false;
}

const char* recordTypeName(const RecordBody& body) {
  if (std::get_if<DepositRecord>(&body)) {
    return "DEPOSIT";
  }
  if (std::get_if<ReservationRecord>(&body)) {
    return "RESERVE";
  }
  if (std::get_if<ReleaseRecord>(&body)) {
    return "RELEASE";
  }
  return "TRANSITION";
}

// -----------------------------------------------------------------------------
// JournalRecord <-> JSON
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const JournalRecord& record) {
  j = nlohmann::json{
      {"seq", record.sequence},
      {"ts_ms", record.timestamp_ms},
      {"type", recordTypeName(record.body)},
  };

  if (const auto* d = std::get_if<DepositRecord>(&record.body)) {
    j["amount"] = d->amount;
  } else if (const auto* r = std::get_if<ReservationRecord>(&record.body)) {
    j["token_id"] = r->token_id;
    j["position_id"] = r->position_id;
    j["market_id"] = r->market_id;
    j["amount"] = r->amount;
    j["reason"] = domain::reservationReasonToString(r->reason);
  } else if (const auto* rel = std::get_if<ReleaseRecord>(&record.body)) {
    j["token_id"] = rel->token_id;
    j["position_id"] = rel->position_id;
    j["market_id"] = rel->market_id;
    j["amount"] = rel->amount;
    j["realized_pnl"] = rel->realized_pnl;
    j["close_reason"] = domain::closeReasonToString(rel->close_reason);
  } else if (const auto* t = std::get_if<TransitionRecord>(&record.body)) {
    j["transition"] = transitionKindToString(t->kind);
    j["position"] = t->position;
  }
}

void from_json(const nlohmann::json& j, JournalRecord& record) {
  record.sequence = j.at("seq").get<std::uint64_t>();
  record.timestamp_ms = j.at("ts_ms").get<std::int64_t>();

  const auto type = j.at("type").get<std::string>();
  if (type == "DEPOSIT") {
    DepositRecord d;
    d.amount = j.at("amount").get<double>();
    record.body = d;
  } else if (type == "RESERVE") {
    ReservationRecord r;
    r.token_id = j.at("token_id").get<domain::TokenId>();
    r.position_id = j.at("position_id").get<std::uint64_t>();
    r.market_id = j.at("market_id").get<std::string>();
    r.amount = j.at("amount").get<double>();
    r.reason = reservationReasonFrom(j);
    record.body = r;
  } else if (type == "RELEASE") {
    ReleaseRecord rel;
    rel.token_id = j.at("token_id").get<domain::TokenId>();
    rel.position_id = j.at("position_id").get<std::uint64_t>();
    rel.market_id = j.at("market_id").get<std::string>();
    rel.amount = j.at("amount").get<double>();
    rel.realized_pnl = j.at("realized_pnl").get<double>();
    rel.close_reason = closeReasonFrom(j, "close_reason");
    record.body = rel;
  } else if (type == "TRANSITION") {
    TransitionRecord t;
    if (!parseTransitionKind(j.at("transition").get<std::string>(), t.kind)) {
      throw std::invalid_argument("bad transition kind");
    }
    t.position = j.at("position").get<domain::Position>();
    record.body = t;
  } else {
    throw std::invalid_argument("unknown journal record type " + type);
  }
}

namespace domain {

// -----------------------------------------------------------------------------
// Position <-> JSON
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Position& p) {
  nlohmann::json tokens = nlohmann::json::array();
  for (const auto& token : p.reservations) {
    tokens.push_back({{"id", token.id}, {"amount", token.amount}});
  }

  j = nlohmann::json{
      {"position_id", p.position_id},
      {"market_id", p.market_id},
      {"side", sideToString(p.side)},
      {"status", positionStatusToString(p.status)},
      {"entry_price", p.entry_price},
      {"stake", p.stake},
      {"contracts", p.contracts},
      {"opened_at_ms", p.opened_at_ms},
      {"closed_at_ms", p.closed_at_ms},
      {"resolution_at_ms", p.resolution_at_ms},
      {"exit_price", p.exit_price},
      {"realized_pnl", p.realized_pnl},
      {"close_reason", closeReasonToString(p.close_reason)},
      {"additions", p.additions},
      {"original_edge", p.original_edge},
      {"last_edge", p.last_edge},
      {"reversal_streak", p.reversal_streak},
      {"reservations", tokens},
  };
}

void from_json(const nlohmann::json& j, Position& p) {
  p.position_id = j.at("position_id").get<std::uint64_t>();
  p.market_id = j.at("market_id").get<std::string>();
  p.side = sideFrom(j, "side");
  if (!parsePositionStatus(j.at("status").get<std::string>(), p.status)) {
    throw std::invalid_argument("bad position status");
  }
  p.entry_price = j.at("entry_price").get<double>();
  p.stake = j.at("stake").get<double>();
  p.contracts = j.at("contracts").get<double>();
  p.opened_at_ms = j.at("opened_at_ms").get<std::int64_t>();
  p.closed_at_ms = j.at("closed_at_ms").get<std::int64_t>();
  p.resolution_at_ms = j.at("resolution_at_ms").get<std::int64_t>();
  p.exit_price = j.at("exit_price").get<double>();
  p.realized_pnl = j.at("realized_pnl").get<double>();
  p.close_reason = closeReasonFrom(j, "close_reason");
  p.additions = j.at("additions").get<int>();
  p.original_edge = j.at("original_edge").get<double>();
  p.last_edge = j.at("last_edge").get<double>();
  p.reversal_streak = j.at("reversal_streak").get<int>();

  p.reservations.clear();
  for (const auto& token : j.at("reservations")) {
    p.reservations.push_back(ReservationToken{
        token.at("id").get<TokenId>(), token.at("amount").get<double>()});
  }
}

}  // namespace domain
}  // namespace paper
