#pragma once

#include <filesystem>
#include <string>

#include "internal/process/child_process.hpp"

namespace fwbuild::workspace {

/*
  Version control operations on one workspace checkout.

  Implementations read only from the local mirror; the network remote is
  updated by an external refresh job and never touched here.

  Failures throw util::CheckoutError with kind GIT_FAILURE,
  CORRUPT_WORKSPACE or UNRESOLVABLE_REF. When `token` is cancelled the
  running command is stopped and process::Cancelled is thrown; the checkout
  is then in an unknown state.
*/
class SourceControl {
 public:
  virtual ~SourceControl() = default;

  // Fresh clone into dir, which must not exist. token may be null.
  virtual void Clone(const std::filesystem::path& dir, const process::OutputSink& log,
                     const process::CancelToken* token) = 0;

  // Hard clean of the working tree, then a detached checkout of ref.
  // Returns the resolved commit id. token may be null.
  virtual std::string Checkout(const std::filesystem::path& dir, const std::string& ref, const process::OutputSink& log,
                               const process::CancelToken* token) = 0;

  virtual bool IsHealthy(const std::filesystem::path& dir) = 0;
};

} // namespace fwbuild::workspace
