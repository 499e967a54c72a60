// gift/basic/diagnostic.hpp - Reportable conversion errors
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "gift/basic/source_manager.hpp"

namespace gift
{

/**
 * One error as shown to the user: a stable code ("E0001"), the message,
 * the question block it refers to (invalid when it is not tied to the
 * input text), a short label printed under that block, and an optional hint.
 */
struct Diagnostic
{
  std::string code;
  std::string message;
  SourceRange range;
  std::string label;
  std::optional<std::string> help;
};

/// Diagnostics collected by one conversion, in report order.
class DiagnosticBag
{
public:
  /// Append an error; the returned reference stays valid until the next report.
  Diagnostic & report_error(std::string code, std::string message, SourceRange range = {});

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  /// Every diagnostic is an error, so this is !empty().
  [[nodiscard]] bool has_errors() const noexcept { return !diagnostics_.empty(); }

  [[nodiscard]] auto begin() const noexcept { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const noexcept { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace gift
