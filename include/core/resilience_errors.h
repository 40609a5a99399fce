#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy shared by CircuitBreaker and ServiceAvailabilityManager
 *
 * - CircuitOpenError: fast-fail, never retried
 * - OperationTimeout: an attempt exceeded its time budget, retried
 * - OperationCancelled: the caller cancelled, never retried
 * - ProbeError: raised inside a health probe, always converted to FAILED
 *
 * Any other std::exception thrown by a wrapped operation is a generic
 * operation error and is retried like a timeout.
 */

class CircuitOpenError : public std::runtime_error {
public:
  CircuitOpenError(const std::string &breaker, const std::string &kind)
      : std::runtime_error("Circuit breaker '" + breaker +
                           "' is OPEN, rejecting " + kind),
        breaker_(breaker), kind_(kind) {}

  const std::string &breaker() const { return breaker_; }
  const std::string &kind() const { return kind_; }

private:
  std::string breaker_;
  std::string kind_;
};

class OperationTimeout : public std::runtime_error {
public:
  explicit OperationTimeout(const std::string &message)
      : std::runtime_error(message) {}
};

class OperationCancelled : public std::runtime_error {
public:
  explicit OperationCancelled(const std::string &message)
      : std::runtime_error(message) {}
};

class ProbeError : public std::runtime_error {
public:
  explicit ProbeError(const std::string &message)
      : std::runtime_error(message) {}
};
