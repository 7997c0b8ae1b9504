#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace health {

// Raised when facts contradict their own construction rules, e.g. a method
// that reports usage of a field its struct does not declare.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(const std::string &message)
      : std::logic_error(message) {}
};

// Raised when the analysis deadline expires before all packages are done.
class AnalysisAborted : public std::runtime_error {
public:
  AnalysisAborted(const std::string &message, std::size_t completed_packages)
      : std::runtime_error(message), completed_packages_(completed_packages) {}

  std::size_t completed_packages() const { return completed_packages_; }

private:
  std::size_t completed_packages_;
};

} // namespace health
