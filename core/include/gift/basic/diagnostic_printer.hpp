// gift/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Output looks like:
//   error[E0001]: brace error in question: Q {
//     --> quiz.gift:3:1
//      |
//    3 | Q {
//      | ^^^ unbalanced braces in this question
//      |
//      = help: escape literal braces as \{ and \}
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "gift/basic/diagnostic.hpp"
#include "gift/basic/source_manager.hpp"

namespace gift
{

class DiagnosticPrinter
{
public:
  /// Colours are written with rang; pass false for plain text (files, tests).
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// `source` may be null when the diagnostic has no document (e.g. export errors).
  void print(const Diagnostic & diag, const SourceFile * source);

  void print_all(const DiagnosticBag & diags, const SourceFile * source);

private:
  void print_header(const Diagnostic & diag);
  void print_snippet(const SourceFile & source, SourceRange range, std::string_view label);
  void print_trailer(std::string_view kind, std::string_view message);

  /// Empty gutter line: "      |".
  void print_gutter();

  [[nodiscard]] std::string display_name(const SourceFile * source) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace gift
