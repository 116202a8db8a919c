#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace pokertable::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result MemoryRepository::InsertTable(Transaction& t, model::TableRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_table_id++;
  } else {
    if (s.tables.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "table exists");
    s.next_table_id = std::max(s.next_table_id, r.id + 1);
  }
  r.updated_at_ms = util::ToUnixMillis(util::Now());
  s.tables[r.id]  = r;
  return Result::Ok();
}

std::optional<model::TableRecord> MemoryRepository::GetTable(Transaction& t, int64_t table_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.tables.find(table_id);
  if (it == s.tables.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TableRecord> MemoryRepository::LockTableForUpdate(Transaction& t, int64_t table_id) {
  auto&      s  = TX(t).Mutable();
  const auto it = s.tables.find(table_id);
  if (it == s.tables.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTable(Transaction& t, const model::TableRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tables.find(r.id);
  if (it == s.tables.end()) return Result::Err(ErrorCode::NotFound, "table not found");
  it->second               = r;
  it->second.updated_at_ms = util::ToUnixMillis(util::Now());
  return Result::Ok();
}

// ------------------------------------------------------------------
// Seats
// ------------------------------------------------------------------

Result MemoryRepository::InsertSeat(Transaction& t, model::SeatRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tables.contains(r.table_id)) return Result::Err(ErrorCode::ConstraintViolation, "seat references unknown table");
  for (const auto& [_, seat] : s.seats) {
    if (seat.table_id == r.table_id && seat.IsActive() && (seat.position == r.position || seat.user_id == r.user_id)) {
      return Result::Err(ErrorCode::AlreadyExists, "seat or user already taken");
    }
  }
  if (r.id == 0) r.id = s.next_seat_id++;
  s.seats[r.id] = r;
  return Result::Ok();
}

std::vector<model::SeatRecord> MemoryRepository::ListActiveSeats(Transaction& t, int64_t table_id) {
  std::vector<model::SeatRecord> out;
  for (const auto& [_, seat] : TX(t).View().seats) {
    if (seat.table_id == table_id && seat.IsActive()) out.push_back(seat);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.position < b.position; });
  return out;
}

Result MemoryRepository::UpdateSeat(Transaction& t, const model::SeatRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.seats.find(r.id);
  if (it == s.seats.end()) return Result::Err(ErrorCode::NotFound, "seat not found");
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Hands
// ------------------------------------------------------------------

Result MemoryRepository::InsertHand(Transaction& t, model::HandRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, hand] : s.hands) {
    if (hand.table_id != r.table_id) continue;
    if (hand.hand_no == r.hand_no) return Result::Err(ErrorCode::AlreadyExists, "hand number already used");
    if (hand.status != pokertable::v1::HAND_STATUS_ENDED) return Result::Err(ErrorCode::Conflict, "table already has a live hand");
  }
  r.id = s.next_hand_id++;
  if (r.started_at_ms == 0) r.started_at_ms = util::ToUnixMillis(util::Now());
  s.hands[r.id] = r;
  return Result::Ok();
}

std::optional<model::HandRecord> MemoryRepository::GetHand(Transaction& t, int64_t hand_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.hands.find(hand_id);
  if (it == s.hands.end()) return std::nullopt;
  return it->second;
}

std::optional<model::HandRecord> MemoryRepository::GetActiveHand(Transaction& t, int64_t table_id) {
  std::optional<model::HandRecord> latest;
  for (const auto& [_, hand] : TX(t).View().hands) {
    if (hand.table_id != table_id || hand.status == pokertable::v1::HAND_STATUS_ENDED) continue;
    if (!latest || hand.hand_no > latest->hand_no) latest = hand;
  }
  return latest;
}

std::optional<model::HandRecord> MemoryRepository::LockHandForUpdate(Transaction& t, int64_t hand_id) {
  // Marks the transaction as a writer so a concurrent commit is detected.
  auto&      s  = TX(t).Mutable();
  const auto it = s.hands.find(hand_id);
  if (it == s.hands.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateHand(Transaction& t, const model::HandRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.hands.find(r.id);
  if (it == s.hands.end()) return Result::Err(ErrorCode::NotFound, "hand not found");
  if (it->second.version + 1 != r.version) return Result::Err(ErrorCode::Conflict, "hand version changed");
  it->second = r;
  return Result::Ok();
}

std::optional<int32_t> MemoryRepository::MaxHandNo(Transaction& t, int64_t table_id) {
  std::optional<int32_t> max_no;
  for (const auto& [_, hand] : TX(t).View().hands) {
    if (hand.table_id == table_id && (!max_no || hand.hand_no > *max_no)) max_no = hand.hand_no;
  }
  return max_no;
}

std::vector<model::HandRecord> MemoryRepository::ListHands(Transaction& t, int64_t table_id) {
  std::vector<model::HandRecord> out;
  for (const auto& [_, hand] : TX(t).View().hands) {
    if (hand.table_id == table_id) out.push_back(hand);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.hand_no < b.hand_no; });
  return out;
}

// ------------------------------------------------------------------
// Hand results
// ------------------------------------------------------------------

Result MemoryRepository::InsertPot(Transaction& t, const model::PotRecord& r) {
  TX(t).Mutable().pots.push_back(r);
  return Result::Ok();
}

std::vector<model::PotRecord> MemoryRepository::ListPots(Transaction& t, int64_t hand_id) {
  std::vector<model::PotRecord> out;
  for (const auto& pot : TX(t).View().pots)
    if (pot.hand_id == hand_id) out.push_back(pot);
  return out;
}

Result MemoryRepository::InsertHandHistory(Transaction& t, const model::HandHistoryRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& h : s.history) {
    if (h.table_id == r.table_id && h.hand_no == r.hand_no) return Result::Err(ErrorCode::AlreadyExists, "history exists");
  }
  s.history.push_back(r);
  return Result::Ok();
}

std::optional<model::HandHistoryRecord> MemoryRepository::GetHandHistory(Transaction& t, int64_t table_id, int32_t hand_no) {
  for (const auto& h : TX(t).View().history) {
    if (h.table_id == table_id && h.hand_no == hand_no) return h;
  }
  return std::nullopt;
}

Result MemoryRepository::InsertAction(Transaction& t, const model::ActionRecord& r) {
  TX(t).Mutable().actions.push_back(r);
  return Result::Ok();
}

std::vector<model::ActionRecord> MemoryRepository::ListActions(Transaction& t, int64_t hand_id) {
  std::vector<model::ActionRecord> out;
  for (const auto& a : TX(t).View().actions)
    if (a.hand_id == hand_id) out.push_back(a);
  return out;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertLedgerEntry(Transaction& t, const model::LedgerRecord& r) {
  TX(t).Mutable().ledger.push_back(r);
  return Result::Ok();
}

std::vector<model::LedgerRecord> MemoryRepository::ListLedgerEntries(Transaction& t, int64_t table_id) {
  std::vector<model::LedgerRecord> out;
  for (const auto& e : TX(t).View().ledger)
    if (e.table_id == table_id) out.push_back(e);
  return out;
}

} // namespace pokertable::db::memory
