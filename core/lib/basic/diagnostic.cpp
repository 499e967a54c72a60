// gift/basic/diagnostic.cpp
#include "gift/basic/diagnostic.hpp"

#include <utility>

namespace gift
{

Diagnostic & DiagnosticBag::report_error(std::string code, std::string message, SourceRange range)
{
  Diagnostic & d = diagnostics_.emplace_back();
  d.code = std::move(code);
  d.message = std::move(message);
  d.range = range;
  return d;
}

}  // namespace gift
