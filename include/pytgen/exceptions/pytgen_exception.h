/***
 * Name: pytgen::exceptions::PytgenException
 * Purpose: Base class for all pytgen exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pytgen must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pytgen {
namespace exceptions {

class PytgenException : public std::exception {
 public:
  ~PytgenException() noexcept override = default;
  const char* what() const noexcept override;

 protected:
  explicit PytgenException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pytgen
