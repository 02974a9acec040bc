#include "value_error.hh"

namespace deltae
{
  ValueError::ValueError(ValueErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
  {}

  OutOfBounds::OutOfBounds(const std::string& value)
    : ValueError(ValueErrorKind::OutOfBounds,
                 "value is out of range: '" + value + "'")
  {}

  BadFormat::BadFormat(const std::string& text)
    : ValueError(ValueErrorKind::BadFormat,
                 "value is malformed: '" + text + "'")
  {}

  InvalidInput::InvalidInput(const std::string& what)
    : std::invalid_argument(what)
  {}
} // namespace deltae
