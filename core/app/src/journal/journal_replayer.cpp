#include "paper/journal/journal_replayer.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <unordered_map>

namespace paper {

ReplayState JournalReplayer::replay(const std::vector<JournalRecord>& records) {
  ReplayState state;

  std::map<domain::TokenId, double> outstanding;
  std::set<domain::TokenId> seen_tokens;
  std::unordered_map<std::string, domain::Position> active;

  for (const auto& record : records) {
    if (record.sequence <= state.last_sequence) {
      ++state.stats.anomalies;
      std::cerr << "[JournalReplayer] Sequence " << record.sequence
                << " does not follow " << state.last_sequence
                << ". Skipping.\n";
      continue;
    }
    state.last_sequence = record.sequence;
    ++state.stats.records;

    auto& cap = state.capital;
    auto mark = [&state, &record] {
      state.capital_trail.push_back(
          CapitalMark{record.timestamp_ms, state.capital.total});
      state.peak_total = std::max(state.peak_total, state.capital.total);
    };

    if (const auto* d = std::get_if<DepositRecord>(&record.body)) {
      ++state.stats.deposits;
      cap.total += d->amount;
      cap.available += d->amount;
      mark();

    } else if (const auto* r = std::get_if<ReservationRecord>(&record.body)) {
      if (!seen_tokens.insert(r->token_id).second) {
        ++state.stats.anomalies;
        std::cerr << "[JournalReplayer] Token " << r->token_id
                  << " reserved again at seq " << record.sequence
                  << ". Skipping.\n";
        continue;
      }
      state.max_token_id = std::max(state.max_token_id, r->token_id);
      ++state.stats.reservations;
      cap.available -= r->amount;
      cap.allocated += r->amount;
      outstanding[r->token_id] = r->amount;

    } else if (const auto* rel = std::get_if<ReleaseRecord>(&record.body)) {
      auto it = outstanding.find(rel->token_id);
      if (it == outstanding.end()) {
        ++state.stats.anomalies;
        std::cerr << "[JournalReplayer] Release of unknown token "
                  << rel->token_id << " at seq " << record.sequence
                  << ". Skipping.\n";
        continue;
      }
      ++state.stats.releases;
      const double amount = it->second;
      outstanding.erase(it);
      cap.allocated -= amount;
      cap.available += amount + rel->realized_pnl;
      cap.total += rel->realized_pnl;
      mark();

    } else if (const auto* t = std::get_if<TransitionRecord>(&record.body)) {
      ++state.stats.transitions;
      const auto& market = t->position.market_id;
      if (t->kind == TransitionKind::Closed) {
        active.erase(market);
        state.closed.push_back(t->position);
      } else {
        active[market] = t->position;
      }
    }
  }

  for (const auto& [id, amount] : outstanding) {
    state.outstanding.push_back(domain::ReservationToken{id, amount});
  }
  for (auto& [market, pos] : active) {
    state.active.push_back(std::move(pos));
  }
  std::sort(state.active.begin(), state.active.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.position_id < b.position_id;
            });

  return state;
}

ReplayState JournalReplayer::replay(const IJournal& journal) {
  JournalReadResult read = journal.readAll();
  ReplayState state = replay(read.records);
  state.stats.lines_total = read.lines_total;
  state.stats.parse_errors = read.parse_errors;
  return state;
}

}  // namespace paper
