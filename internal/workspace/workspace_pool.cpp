#include "internal/workspace/workspace_pool.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fwbuild::workspace {

namespace fs = std::filesystem;
using fwbuild::observability::IntField;
using fwbuild::observability::StringField;

struct WorkspaceLease::Slot {
  uint32_t id = 0;
  fs::path dir;

  std::mutex  mutex;
  std::string owner;
  bool        dirty         = false;
  bool        needs_reclone = false;
};

// ------------------------------------------------------------------
// WorkspaceLease
// ------------------------------------------------------------------

WorkspaceLease::WorkspaceLease(WorkspacePool* pool, Slot* slot) : pool_(pool), slot_(slot) {
}

WorkspaceLease::~WorkspaceLease() {
  Release();
}

WorkspaceLease::WorkspaceLease(WorkspaceLease&& other) noexcept : pool_(other.pool_), slot_(other.slot_) {
  other.pool_ = nullptr;
  other.slot_ = nullptr;
}

WorkspaceLease& WorkspaceLease::operator=(WorkspaceLease&& other) noexcept {
  if (this != &other) {
    Release();
    pool_       = other.pool_;
    slot_       = other.slot_;
    other.pool_ = nullptr;
    other.slot_ = nullptr;
  }
  return *this;
}

uint32_t WorkspaceLease::SlotId() const {
  return slot_->id;
}

const std::string& WorkspaceLease::Owner() const {
  return slot_->owner;
}

fs::path WorkspaceLease::Root() const {
  return slot_->dir;
}

fs::path WorkspaceLease::SourceDir() const {
  return slot_->dir / "src";
}

fs::path WorkspaceLease::OutDir() const {
  return slot_->dir / "out";
}

fs::path WorkspaceLease::ConfigPath() const {
  return slot_->dir / "extra_hwdef.dat";
}

void WorkspaceLease::MarkDirty() {
  std::lock_guard lock(slot_->mutex);
  slot_->dirty = true;
}

void WorkspaceLease::Release() {
  if (!pool_) return;
  auto* pool = pool_;
  auto* slot = slot_;
  pool_      = nullptr;
  slot_      = nullptr;
  pool->Release(slot);
}

// ------------------------------------------------------------------
// WorkspacePool
// ------------------------------------------------------------------

WorkspacePool::WorkspacePool(fs::path root, uint32_t count, std::shared_ptr<SourceControl> source_control)
    : root_(std::move(root)), source_control_(std::move(source_control)) {
  if (count == 0) throw std::invalid_argument("workspace pool needs at least one slot");

  slots_.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    auto slot = std::make_unique<Slot>();
    slot->id  = i;
    slot->dir = root_ / ("slot-" + std::to_string(i));
    slots_.push_back(std::move(slot));
    free_.push_back(i);
  }
}

WorkspacePool::~WorkspacePool() = default;

void WorkspacePool::Initialize() {
  fs::create_directories(root_);

  for (auto& slot : slots_) {
    fs::create_directories(slot->dir / "out");

    std::lock_guard lock(slot->mutex);
    if (source_control_->IsHealthy(slot->dir / "src")) continue;

    try {
      Reclone(*slot, nullptr, nullptr);
    } catch (const util::CheckoutError& e) {
      slot->needs_reclone = true;
      FWBUILD_LOG_WARN("workspace clone failed", {IntField("slot", slot->id), StringField("error", e.what())});
    }
  }
}

WorkspaceLease WorkspacePool::Acquire(const std::string& build_id) {
  uint32_t id;
  {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return shutdown_ || !free_.empty(); });
    if (shutdown_) throw util::ShuttingDown("workspace pool is shutting down");

    id = free_.front();
    free_.pop_front();
  }

  auto& slot = *slots_[id];
  {
    std::lock_guard lock(slot.mutex);
    slot.owner = build_id;
  }

  FWBUILD_LOG_DEBUG("workspace leased", {IntField("slot", id), StringField("build_id", build_id)});
  return WorkspaceLease(this, &slot);
}

void WorkspacePool::Release(Slot* slot) {
  std::string owner;
  {
    std::lock_guard lock(slot->mutex);
    owner = std::move(slot->owner);
    slot->owner.clear();
  }
  {
    std::lock_guard lock(mutex_);
    free_.push_back(slot->id);
  }
  cv_.notify_one();

  FWBUILD_LOG_DEBUG("workspace released", {IntField("slot", slot->id), StringField("build_id", owner)});
}

// Caller holds slot.mutex.
void WorkspacePool::Reclone(Slot& slot, const process::OutputSink& log, const process::CancelToken* token) {
  auto src = slot.dir / "src";
  FWBUILD_LOG_INFO("cloning workspace", {IntField("slot", slot.id), StringField("path", src.string())});

  std::error_code ec;
  fs::remove_all(src, ec);
  if (ec) {
    throw util::CheckoutError(fwbuild::v1::ERROR_KIND_CORRUPT_WORKSPACE,
                              "cannot remove " + src.string() + ": " + ec.message());
  }
  fs::create_directories(slot.dir);
  source_control_->Clone(src, log, token);
  slot.needs_reclone = false;
}

// Caller holds slot.mutex. Output left behind would be collected as the
// next build's artifacts.
void WorkspacePool::ClearOutputs(Slot& slot) {
  const auto out    = slot.dir / "out";
  const auto config = slot.dir / "extra_hwdef.dat";

  std::error_code ec;
  fs::remove_all(out, ec);
  if (!ec) fs::create_directories(out, ec);
  if (ec) {
    throw util::CheckoutError(fwbuild::v1::ERROR_KIND_CORRUPT_WORKSPACE,
                              "cannot empty " + out.string() + ": " + ec.message());
  }
  fs::remove(config, ec);
  if (ec) {
    throw util::CheckoutError(fwbuild::v1::ERROR_KIND_CORRUPT_WORKSPACE,
                              "cannot remove " + config.string() + ": " + ec.message());
  }
}

std::string WorkspacePool::Reset(WorkspaceLease& lease, const std::string& ref, const process::OutputSink& log,
                                 const process::CancelToken* token) {
  auto& slot = *lease.slot_;
  std::lock_guard lock(slot.mutex);

  try {
    if (slot.needs_reclone) {
      Reclone(slot, log, token);
    }
    ClearOutputs(slot);

    auto commit = source_control_->Checkout(slot.dir / "src", ref, log, token);
    slot.dirty  = false;
    FWBUILD_LOG_INFO("workspace reset", {IntField("slot", slot.id), StringField("build_id", slot.owner),
                                         StringField("ref", ref), StringField("commit", commit)});
    return commit;
  } catch (const util::CheckoutError& e) {
    slot.dirty = true;
    if (e.Kind() == fwbuild::v1::ERROR_KIND_CORRUPT_WORKSPACE) {
      slot.needs_reclone = true;
      FWBUILD_LOG_WARN("workspace corrupt; re-clone scheduled",
                       {IntField("slot", slot.id), StringField("build_id", slot.owner), StringField("error", e.what())});
    }
    throw;
  } catch (const process::Cancelled& e) {
    // a git command killed part-way can leave locks and a half-written index
    slot.dirty         = true;
    slot.needs_reclone = true;
    FWBUILD_LOG_WARN("workspace reset interrupted; re-clone scheduled",
                     {IntField("slot", slot.id), StringField("build_id", slot.owner), StringField("error", e.what())});
    throw;
  }
}

uint32_t WorkspacePool::Capacity() const {
  return static_cast<uint32_t>(slots_.size());
}

uint32_t WorkspacePool::Available() const {
  std::lock_guard lock(mutex_);
  return static_cast<uint32_t>(free_.size());
}

std::vector<WorkspaceInfo> WorkspacePool::Snapshot() const {
  std::vector<WorkspaceInfo> out;
  out.reserve(slots_.size());
  for (const auto& slot : slots_) {
    std::lock_guard lock(slot->mutex);
    out.push_back({slot->id, slot->owner, slot->dirty, slot->needs_reclone});
  }
  return out;
}

void WorkspacePool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace fwbuild::workspace
