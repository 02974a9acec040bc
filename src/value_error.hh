#pragma once

#include <stdexcept>
#include <string>

namespace deltae
{
  enum class ValueErrorKind
  {
    OutOfBounds,
    BadFormat
  };

  // Base of the errors raised for user supplied values
  class ValueError : public std::runtime_error
  {
  public:
    ValueError(ValueErrorKind kind, const std::string& message);

    ValueErrorKind kind() const noexcept { return kind_; }

  private:
    ValueErrorKind kind_;
  };

  // A constructed value violates the numeric range of its domain
  class OutOfBounds : public ValueError
  {
  public:
    explicit OutOfBounds(const std::string& value);
  };

  // Text does not hold the expected count/type of numeric fields
  class BadFormat : public ValueError
  {
  public:
    explicit BadFormat(const std::string& text);
  };

  // Unknown method names, degenerate illuminants
  class InvalidInput : public std::invalid_argument
  {
  public:
    explicit InvalidInput(const std::string& what);
  };
} // namespace deltae
