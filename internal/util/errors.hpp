#pragma once

#include <stdexcept>
#include <string>

namespace upload::util {

/*
  Central error types.

  Planning errors fail a file before it reaches the worker pool.
  Transport errors fail a file for this run; its checkpoint survives.
  Consistency errors mean recorded state cannot be trusted: a corrupt
  checkpoint, or a completed upload whose size disagrees with the file.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PlanningError : public std::runtime_error {
 public:
  explicit PlanningError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConsistencyError : public std::runtime_error {
 public:
  explicit ConsistencyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg = "upload cancelled") : std::runtime_error(msg) {
  }
};

} // namespace upload::util
