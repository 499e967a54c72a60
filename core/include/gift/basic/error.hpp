// gift/basic/error.hpp - Fatal conversion errors
//
// Every malformed question aborts the whole parse/export call. Core code
// throws GiftError; the driver turns it into a Diagnostic.
//
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "gift/basic/source_manager.hpp"

namespace gift
{

enum class ErrorKind : uint8_t {
  BraceMismatch,             ///< unbalanced or missing answer delimiters
  InsufficientAlternatives,  ///< too few answers/pairs for the question type
  MalformedNumeric,          ///< a numerical value is not a finite number
  MissingSeparator,          ///< a matching pair without '->'
  UnsupportedVariant,        ///< unknown qtype on export
  MalformedDocument,         ///< JSON document of the wrong shape
  Io,                        ///< unreadable input / unwritable output
};

/// Stable diagnostic code, e.g. "E0001" for BraceMismatch.
[[nodiscard]] std::string_view error_code(ErrorKind kind) noexcept;

class GiftError : public std::runtime_error
{
public:
  GiftError(ErrorKind kind, const std::string & message, SourceRange range = {})
  : std::runtime_error(message), kind_(kind), range_(range)
  {
  }

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

  /// Offending span in the input document (invalid for export errors).
  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  ErrorKind kind_;
  SourceRange range_;
};

}  // namespace gift
