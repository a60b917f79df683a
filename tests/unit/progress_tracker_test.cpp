#include "internal/artifacts/progress_tracker.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using fwbuild::artifacts::LastStepMarker;
using fwbuild::artifacts::ProgressPercent;

void TestLastMarkerWins() {
  const std::string log =
      "Setting top to : /ardupilot\n"
      "[ 3/12] Compiling libraries/AP_HAL/Device.cpp\n"
      "[1/450] Compiling ArduCopter/Copter.cpp\n"
      "[225/450] Compiling ArduCopter/mode_auto.cpp\n"
      "some trailing [noise] line\n";

  auto marker = LastStepMarker(log);
  assert(marker.has_value());
  assert(marker->first == 225);
  assert(marker->second == 450);
}

void TestDecoratedMarkersParse() {
  auto marker = LastStepMarker("[ 12 / 340 ] Linking build/SPEDIXF405/bin/arducopter");
  assert(marker.has_value());
  assert(marker->first == 12);
  assert(marker->second == 340);
}

void TestNoMarker() {
  assert(!LastStepMarker("").has_value());
  assert(!LastStepMarker("[ok] nothing to see\n[a/b]\n").has_value());
  assert(ProgressPercent("configure only\n") == 0);
}

void TestPhaseWeights() {
  // configure and library phases
  assert(ProgressPercent("[5/10] x") == 1);
  assert(ProgressPercent("[0/19] x") == 1);

  // OS phase: 4% spread
  assert(ProgressPercent("[0/100] x") == 1);
  assert(ProgressPercent("[50/100] x") == 3);
  assert(ProgressPercent("[100/100] x") == 5);

  // firmware compile: 95% spread
  assert(ProgressPercent("[0/1000] x") == 5);
  assert(ProgressPercent("[500/1000] x") == 52);
  assert(ProgressPercent("[1000/1000] x") == 100);
}

void TestOverrunIsClamped() {
  assert(ProgressPercent("[1200/1000] x") == 100);
}

void TestNineDigitCountsDoNotOverflow() {
  assert(ProgressPercent("[500000000/999999999] x") == 52);
  assert(ProgressPercent("[999999999/999999999] x") == 100);
  assert(ProgressPercent("[99/150] x") == 3);
}

} // namespace

int main() {
  TestLastMarkerWins();
  TestDecoratedMarkersParse();
  TestNoMarker();
  TestPhaseWeights();
  TestOverrunIsClamped();
  TestNineDigitCountsDoNotOverflow();

  std::cout << "fwbuild_unit_progress_tracker: pass\n";
  return 0;
}
