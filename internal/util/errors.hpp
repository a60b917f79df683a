#pragma once

#include <stdexcept>
#include <string>

#include "fwbuild/v1.hpp"

namespace fwbuild::util {

/*
  Central error types.

  Admission errors reach the caller of Submit. Everything raised after a
  build exists is caught at the job boundary and recorded on the build.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ShuttingDown : public std::runtime_error {
 public:
  explicit ShuttingDown(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage write path failed. Fatal to the orchestrator.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CatalogUnavailable : public std::runtime_error {
 public:
  explicit CatalogUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Errors classified by ErrorKind.
*/
class KindedError : public std::runtime_error {
 public:
  KindedError(fwbuild::v1::ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  fwbuild::v1::ErrorKind Kind() const {
    return kind_;
  }

 private:
  fwbuild::v1::ErrorKind kind_;
};

// QUEUE_FULL, INVALID_REQUEST, CATALOG_UNAVAILABLE
class AdmissionError : public KindedError {
 public:
  using KindedError::KindedError;
};

// INCOMPATIBLE_FEATURES, UNRESOLVABLE_REF
class ConfigError : public KindedError {
 public:
  using KindedError::KindedError;
};

// GIT_FAILURE, CORRUPT_WORKSPACE, UNRESOLVABLE_REF
class CheckoutError : public KindedError {
 public:
  using KindedError::KindedError;
};

} // namespace fwbuild::util
