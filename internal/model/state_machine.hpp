#pragma once

#include "fwbuild/v1.hpp"

namespace fwbuild::model {

using fwbuild::v1::BuildState;

constexpr bool IsTerminal(BuildState state) {
  return state == BuildState::BUILD_STATE_SUCCESS || state == BuildState::BUILD_STATE_FAILURE ||
         state == BuildState::BUILD_STATE_CANCELLED;
}

constexpr bool IsActive(BuildState state) {
  return state == BuildState::BUILD_STATE_PENDING || state == BuildState::BUILD_STATE_RUNNING;
}

/*
  PENDING -> RUNNING | CANCELLED
  RUNNING -> SUCCESS | FAILURE | CANCELLED
  terminal states never transition again
*/
constexpr bool CanTransition(BuildState from, BuildState to) {
  switch (from) {
    case BuildState::BUILD_STATE_PENDING:
      return to == BuildState::BUILD_STATE_RUNNING || to == BuildState::BUILD_STATE_CANCELLED;
    case BuildState::BUILD_STATE_RUNNING:
      return IsTerminal(to);
    default:
      return false;
  }
}

const char* StateName(BuildState state);

} // namespace fwbuild::model
