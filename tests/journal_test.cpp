// =============================================================================
// journal_test.cpp
// =============================================================================
// Unit tests for paper::InMemoryJournal, paper::FileJournal and
// paper::CapitalSnapshotFile.
//
// Validates:
//   - Batches get consecutive sequence numbers, all or nothing
//   - Injected failures leave the journal untouched
//   - FileJournal survives a reopen with every field of every record type
//   - Malformed lines are skipped and counted, not fatal
//   - Capital checkpoints round trip; a missing file loads as nullopt
//   - A checkpoint write leaves no temp file behind and fails cleanly when
//     the directory cannot hold it
//
// File tests use a per-test temp directory.
// =============================================================================

#include "paper/journal/capital_snapshot_file.hpp"
#include "paper/journal/file_journal.hpp"
#include "paper/journal/in_memory_journal.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace {

paper::JournalRecord deposit(double amount) {
  return paper::JournalRecord{0, 100, paper::DepositRecord{amount}};
}

paper::JournalRecord reservation(paper::domain::TokenId token, double amount) {
  paper::ReservationRecord r;
  r.token_id = token;
  r.position_id = 1;
  r.market_id = "ELECTION";
  r.amount = amount;
  r.reason = paper::domain::ReservationReason::AverageDown;
  return paper::JournalRecord{0, 200, r};
}

paper::JournalRecord closedTransition() {
  paper::domain::Position pos;
  pos.position_id = 1;
  pos.market_id = "ELECTION";
  pos.side = paper::domain::Side::No;
  pos.status = paper::domain::PositionStatus::Closed;
  pos.entry_price = 0.35;
  pos.stake = 70.0;
  pos.contracts = 200.0;
  pos.opened_at_ms = 10;
  pos.closed_at_ms = 20;
  pos.resolution_at_ms = 30;
  pos.exit_price = 1.0;
  pos.realized_pnl = 130.0;
  pos.close_reason = paper::domain::CloseReason::Resolved;
  pos.additions = 1;
  pos.original_edge = 0.12;
  pos.last_edge = -0.03;
  pos.reversal_streak = 1;
  pos.reservations = {{1, 50.0}, {4, 20.0}};
  return paper::JournalRecord{
      0, 300, paper::TransitionRecord{paper::TransitionKind::Closed, pos}};
}

}  // namespace

class JournalTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("paper_journal_test_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  std::string path(const std::string& name) const {
    return (dir_ / name).string();
  }

  fs::path dir_;
};

// -----------------------------------------------------------------------------
// 1. In-memory: consecutive sequences across batches.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, InMemorySequencesBatches) {
  paper::InMemoryJournal journal;
  EXPECT_EQ(journal.lastSequence(), 0u);

  auto first = journal.append({deposit(1000.0)});
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.value(), 1u);

  auto second = journal.append({reservation(1, 50.0), closedTransition()});
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(second.value(), 3u);

  const auto read = journal.readAll();
  ASSERT_EQ(read.records.size(), 3u);
  for (std::size_t i = 0; i < read.records.size(); ++i) {
    EXPECT_EQ(read.records[i].sequence, i + 1);
  }
  EXPECT_EQ(read.lines_total, 3u);
  EXPECT_EQ(read.parse_errors, 0u);
}

// -----------------------------------------------------------------------------
// 2. Injected failures write nothing and are counted.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, InMemoryInjectedFailure) {
  paper::InMemoryJournal journal;
  journal.failNextAppends(2);

  auto a = journal.append({deposit(1.0)});
  auto b = journal.append({deposit(1.0)});
  ASSERT_FALSE(a.ok());
  ASSERT_FALSE(b.ok());
  EXPECT_EQ(a.kind(), paper::ErrorKind::JournalWriteFailure);
  EXPECT_EQ(journal.failedAppends(), 2);
  EXPECT_EQ(journal.lastSequence(), 0u);

  auto c = journal.append({deposit(1.0)});
  ASSERT_TRUE(c.ok());
  EXPECT_EQ(c.value(), 1u);
}

// -----------------------------------------------------------------------------
// 3. FileJournal: every field survives close and reopen.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, FileJournalPersistsAcrossReopen) {
  const auto file = path("journal.jsonl");
  {
    paper::FileJournal journal(file);
    ASSERT_TRUE(journal.append({deposit(1000.0)}).ok());
    ASSERT_TRUE(
        journal.append({reservation(4, 20.0), closedTransition()}).ok());
    EXPECT_EQ(journal.lastSequence(), 3u);
  }

  paper::FileJournal reopened(file);
  EXPECT_EQ(reopened.lastSequence(), 3u);

  const auto read = reopened.readAll();
  ASSERT_EQ(read.records.size(), 3u);
  EXPECT_EQ(read.parse_errors, 0u);

  const auto* d = std::get_if<paper::DepositRecord>(&read.records[0].body);
  ASSERT_NE(d, nullptr);
  EXPECT_DOUBLE_EQ(d->amount, 1000.0);
  EXPECT_EQ(read.records[0].timestamp_ms, 100);

  const auto* r = std::get_if<paper::ReservationRecord>(&read.records[1].body);
  ASSERT_NE(r, nullptr);
  EXPECT_EQ(r->token_id, 4u);
  EXPECT_EQ(r->market_id, "ELECTION");
  EXPECT_EQ(r->reason, paper::domain::ReservationReason::AverageDown);

  const auto* t = std::get_if<paper::TransitionRecord>(&read.records[2].body);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->kind, paper::TransitionKind::Closed);
  const auto& pos = t->position;
  EXPECT_EQ(pos.side, paper::domain::Side::No);
  EXPECT_EQ(pos.status, paper::domain::PositionStatus::Closed);
  EXPECT_EQ(pos.close_reason, paper::domain::CloseReason::Resolved);
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 130.0);
  EXPECT_DOUBLE_EQ(pos.last_edge, -0.03);
  EXPECT_EQ(pos.resolution_at_ms, 30);
  EXPECT_EQ(pos.additions, 1);
  EXPECT_EQ(pos.reversal_streak, 1);
  ASSERT_EQ(pos.reservations.size(), 2u);
  EXPECT_EQ(pos.reservations[1].id, 4u);
  EXPECT_DOUBLE_EQ(pos.reservations[1].amount, 20.0);

  // Appends after reopen continue the sequence.
  auto next = reopened.append({deposit(5.0)});
  ASSERT_TRUE(next.ok());
  EXPECT_EQ(next.value(), 4u);
}

// -----------------------------------------------------------------------------
// 4. A torn or garbage line is skipped and counted.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, FileJournalSkipsMalformedLines) {
  const auto file = path("journal.jsonl");
  {
    paper::FileJournal journal(file);
    ASSERT_TRUE(journal.append({deposit(1000.0)}).ok());
  }
  {
    std::ofstream out(file, std::ios::app);
    out << "{\"seq\": 2, \"type\": \"DEPO\n";
    out << "{\"seq\": 3, \"type\": \"TELEPORT\", \"ts_ms\": 0}\n";
  }

  paper::FileJournal reopened(file);
  const auto read = reopened.readAll();
  EXPECT_EQ(read.lines_total, 3u);
  EXPECT_EQ(read.parse_errors, 2u);
  ASSERT_EQ(read.records.size(), 1u);
  EXPECT_EQ(reopened.lastSequence(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Unwritable location: the constructor throws.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, FileJournalUnopenablePathThrows) {
  // A directory cannot be opened for append.
  fs::create_directories(dir_ / "is_a_dir");
  EXPECT_THROW(paper::FileJournal((dir_ / "is_a_dir").string()),
               std::runtime_error);
}

// -----------------------------------------------------------------------------
// 6. Capital checkpoints: write then load, missing file is nullopt.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, CapitalSnapshotFile) {
  paper::CapitalSnapshotFile missing(path("none/snapshot.json"));
  EXPECT_FALSE(missing.load().has_value());

  paper::CapitalSnapshotFile file(path("state/snapshot.json"));
  ASSERT_TRUE(file.write({{1040.0, 940.0, 100.0}, 17}));

  const auto loaded = file.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_DOUBLE_EQ(loaded->capital.total, 1040.0);
  EXPECT_DOUBLE_EQ(loaded->capital.available, 940.0);
  EXPECT_DOUBLE_EQ(loaded->capital.allocated, 100.0);
  EXPECT_EQ(loaded->last_sequence, 17u);

  // Overwrite in place.
  ASSERT_TRUE(file.write({{1000.0, 1000.0, 0.0}, 18}));
  EXPECT_EQ(file.load()->last_sequence, 18u);
}

// -----------------------------------------------------------------------------
// 7. Checkpoint writes: the temp file is renamed away on success; an
//    unusable directory reports failure and leaves nothing behind.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, CapitalSnapshotFileWriteIsAtomic) {
  const auto target = path("snapshot.json");
  paper::CapitalSnapshotFile file(target);
  ASSERT_TRUE(file.write({{900.0, 900.0, 0.0}, 4}));
  EXPECT_TRUE(fs::exists(target));
  EXPECT_FALSE(fs::exists(target + ".tmp"));

  // A regular file where the directory should be.
  { std::ofstream(path("blocker")) << "x"; }
  paper::CapitalSnapshotFile blocked(path("blocker/snapshot.json"));
  EXPECT_FALSE(blocked.write({{900.0, 900.0, 0.0}, 5}));
  EXPECT_FALSE(blocked.load().has_value());

  EXPECT_EQ(file.load()->last_sequence, 4u);
}
