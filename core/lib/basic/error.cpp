// gift/basic/error.cpp
#include "gift/basic/error.hpp"

namespace gift
{

std::string_view error_code(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::BraceMismatch:
      return "E0001";
    case ErrorKind::InsufficientAlternatives:
      return "E0002";
    case ErrorKind::MalformedNumeric:
      return "E0003";
    case ErrorKind::MissingSeparator:
      return "E0004";
    case ErrorKind::UnsupportedVariant:
      return "E0005";
    case ErrorKind::MalformedDocument:
      return "E0006";
    case ErrorKind::Io:
      return "E0007";
  }
  return "";
}

}  // namespace gift
