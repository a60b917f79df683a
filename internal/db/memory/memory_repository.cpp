#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fwbuild::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertBuild(Transaction& t, const model::BuildRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.builds.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  for (const auto& [_, existing] : s.builds) {
    if (existing.sequence == r.sequence) return Result::Err(ErrorCode::ConstraintViolation, "duplicate sequence");
  }
  s.builds[r.id] = r;
  return Result::Ok();
}

std::optional<model::BuildRecord> MemoryRepository::GetBuild(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.builds.find(id);
  if (it == s.builds.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BuildRecord> MemoryRepository::ListBuilds(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::BuildRecord> records;
  records.reserve(s.builds.size());
  for (const auto& [_, record] : s.builds) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return records;
}

Result MemoryRepository::UpdateBuild(Transaction& t, const model::BuildRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.builds.contains(r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  s.builds[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteBuild(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.builds.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

uint64_t MemoryRepository::MaxSequence(Transaction& t) {
  uint64_t max_sequence = 0;
  for (const auto& [_, record] : TX(t).View().builds) {
    max_sequence = std::max(max_sequence, record.sequence);
  }
  return max_sequence;
}

} // namespace fwbuild::db::memory
