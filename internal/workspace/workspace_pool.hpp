#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/workspace/source_control.hpp"

namespace fwbuild::workspace {

class WorkspacePool;

struct WorkspaceInfo {
  uint32_t    slot_id = 0;
  std::string lease_owner; // empty when free
  bool        dirty         = false;
  bool        needs_reclone = false;
};

/*
  Exclusive hold on one slot by one build.

  Move-only. The slot returns to the pool when the lease is destroyed or
  released, on every exit path of the holder.
*/
class WorkspaceLease {
 public:
  WorkspaceLease() = default;
  ~WorkspaceLease();

  WorkspaceLease(WorkspaceLease&& other) noexcept;
  WorkspaceLease& operator=(WorkspaceLease&& other) noexcept;

  WorkspaceLease(const WorkspaceLease&)            = delete;
  WorkspaceLease& operator=(const WorkspaceLease&) = delete;

  explicit operator bool() const {
    return pool_ != nullptr;
  }

  uint32_t           SlotId() const;
  const std::string& Owner() const;

  std::filesystem::path Root() const;
  std::filesystem::path SourceDir() const;
  std::filesystem::path OutDir() const;
  std::filesystem::path ConfigPath() const;

  // The holder changed the checkout (configuration written, toolchain run).
  void MarkDirty();

  void Release();

 private:
  friend class WorkspacePool;

  struct Slot;
  WorkspaceLease(WorkspacePool* pool, Slot* slot);

  WorkspacePool* pool_ = nullptr;
  Slot*          slot_ = nullptr;
};

/*
  Fixed set of source checkouts under root:

    <root>/slot-<N>/src               checkout
    <root>/slot-<N>/out               toolchain output
    <root>/slot-<N>/extra_hwdef.dat   configuration artifact

  The pool mutex guards only the free list; each slot has its own mutex
  for reset and corruption bookkeeping, so work on different slots never
  serializes.
*/
class WorkspacePool {
 public:
  WorkspacePool(std::filesystem::path root, uint32_t count, std::shared_ptr<SourceControl> source_control);
  ~WorkspacePool();

  WorkspacePool(const WorkspacePool&)            = delete;
  WorkspacePool& operator=(const WorkspacePool&) = delete;

  // Creates slot directories and clones slots that lack a usable checkout.
  // A slot whose clone fails is retried on its next Reset.
  void Initialize();

  // Blocks until a slot is free. Throws util::ShuttingDown after Shutdown().
  WorkspaceLease Acquire(const std::string& build_id);

  /*
    Hard clean + checkout of ref in the leased slot. Empties out/ and removes
    the previous configuration. A slot marked for re-clone is cloned afresh
    first. Returns the checked-out commit.

    Throws util::CheckoutError; CORRUPT_WORKSPACE (including outputs that
    cannot be cleared) marks the slot for re-clone before its next lease.
    Throws process::Cancelled when token fires; the interrupted slot is
    re-cloned before its next use.
  */
  std::string Reset(WorkspaceLease& lease, const std::string& ref, const process::OutputSink& log,
                    const process::CancelToken* token = nullptr);

  uint32_t Capacity() const;
  uint32_t Available() const;

  std::vector<WorkspaceInfo> Snapshot() const;

  // Wakes blocked Acquire calls; they throw ShuttingDown.
  void Shutdown();

 private:
  friend class WorkspaceLease;
  using Slot = WorkspaceLease::Slot;

  void Release(Slot* slot);
  void Reclone(Slot& slot, const process::OutputSink& log, const process::CancelToken* token);
  void ClearOutputs(Slot& slot);

  std::filesystem::path          root_;
  std::shared_ptr<SourceControl> source_control_;

  std::vector<std::unique_ptr<Slot>> slots_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<uint32_t>    free_;
  bool                    shutdown_ = false;
};

} // namespace fwbuild::workspace
