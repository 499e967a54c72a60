// gift/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// fmt does the layout, rang the colours.
//
#include "gift/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>

namespace gift
{

namespace
{

constexpr std::string_view k_tab_expansion = "    ";

/// Tabs widen to four columns so the caret line stays aligned.
std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += k_tab_expansion;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile * source)
{
  for (const auto & d : diags) {
    print(d, source);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile * source)
{
  print_header(diag);

  const LineColumn where = source ? source->locate(diag.range.get_begin()) : LineColumn{};
  const std::string name = display_name(source);
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "  -->";
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  if (where.line > 0) {
    fmt::print(os_, " {}:{}:{}\n", name, where.line, where.column);
  } else {
    fmt::print(os_, " {}\n", name);
  }
  print_gutter();

  if (source && diag.range.is_valid()) {
    print_snippet(*source, diag.range, diag.label);
  } else if (!diag.label.empty()) {
    print_trailer("note", diag.label);
  }

  if (diag.help) {
    print_trailer("help", *diag.help);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  if (use_color_) os_ << rang::style::bold << rang::fg::red;
  os_ << "error";
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  if (use_color_) os_ << rang::fg::reset;
  os_ << ": " << diag.message;
  if (use_color_) os_ << rang::style::reset;
  os_ << "\n";
}

void DiagnosticPrinter::print_snippet(
  const SourceFile & source, SourceRange range, std::string_view label)
{
  const LineColumn begin = source.locate(range.get_begin());
  const LineColumn end = source.locate(range.get_end());
  const std::string_view line = source.line_text(begin.line);
  if (begin.line == 0 || line.empty()) {
    return;
  }

  // A block spanning several lines is underlined to the end of its first line.
  const auto line_end = static_cast<uint32_t>(line.size()) + 1;
  const uint32_t last_column = std::max(
    end.line == begin.line ? end.column : line_end, begin.column + 1);

  if (use_color_) os_ << rang::fg::cyan;
  fmt::print(os_, " {:>4} ", begin.line);
  if (use_color_) os_ << rang::fg::reset;
  fmt::print(os_, "| {}\n", expand_tabs(line));

  const std::string_view lead = line.substr(0, std::min<size_t>(begin.column - 1, line.size()));
  const std::string padding(expand_tabs(lead).size(), ' ');
  fmt::print(os_, "      | {}", padding);
  if (use_color_) os_ << rang::fg::red << rang::style::bold;
  os_ << std::string(last_column - begin.column, '^');
  if (!label.empty()) {
    os_ << " " << label;
  }
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  os_ << "\n";
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  print_gutter();
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "   =";
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, " {}: {}\n", kind, message);
}

void DiagnosticPrinter::print_gutter()
{
  if (use_color_) os_ << rang::fg::cyan << rang::style::bold;
  os_ << "      |";
  if (use_color_) os_ << rang::style::reset << rang::fg::reset;
  os_ << "\n";
}

std::string DiagnosticPrinter::display_name(const SourceFile * source) const
{
  if (source == nullptr || source->path().empty()) {
    return "<input>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(source->path(), std::filesystem::current_path(), ec);
  return (ec || rel.empty()) ? source->path().string() : rel.string();
}

}  // namespace gift
