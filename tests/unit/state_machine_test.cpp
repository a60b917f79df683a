#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace fwbuild::v1;
using fwbuild::model::CanTransition;

constexpr BuildState kAll[] = {BUILD_STATE_PENDING, BUILD_STATE_RUNNING, BUILD_STATE_SUCCESS, BUILD_STATE_FAILURE,
                               BUILD_STATE_CANCELLED};

static_assert(CanTransition(BUILD_STATE_PENDING, BUILD_STATE_RUNNING));
static_assert(!CanTransition(BUILD_STATE_SUCCESS, BUILD_STATE_PENDING));

void TestAllowedTransitions() {
  assert(CanTransition(BUILD_STATE_PENDING, BUILD_STATE_RUNNING));
  assert(CanTransition(BUILD_STATE_PENDING, BUILD_STATE_CANCELLED));
  assert(CanTransition(BUILD_STATE_RUNNING, BUILD_STATE_SUCCESS));
  assert(CanTransition(BUILD_STATE_RUNNING, BUILD_STATE_FAILURE));
  assert(CanTransition(BUILD_STATE_RUNNING, BUILD_STATE_CANCELLED));
}

void TestForbiddenTransitions() {
  // a build never finishes without having run, unless cancelled
  assert(!CanTransition(BUILD_STATE_PENDING, BUILD_STATE_SUCCESS));
  assert(!CanTransition(BUILD_STATE_PENDING, BUILD_STATE_FAILURE));
  assert(!CanTransition(BUILD_STATE_RUNNING, BUILD_STATE_PENDING));
  assert(!CanTransition(BUILD_STATE_RUNNING, BUILD_STATE_RUNNING));

  for (auto from : {BUILD_STATE_SUCCESS, BUILD_STATE_FAILURE, BUILD_STATE_CANCELLED}) {
    assert(fwbuild::model::IsTerminal(from));
    for (auto to : kAll) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestActiveStates() {
  assert(fwbuild::model::IsActive(BUILD_STATE_PENDING));
  assert(fwbuild::model::IsActive(BUILD_STATE_RUNNING));
  assert(!fwbuild::model::IsActive(BUILD_STATE_CANCELLED));
  assert(!fwbuild::model::IsTerminal(BUILD_STATE_RUNNING));
}

} // namespace

int main() {
  TestAllowedTransitions();
  TestForbiddenTransitions();
  TestActiveStates();

  std::cout << "fwbuild_unit_state_machine: pass\n";
  return 0;
}
