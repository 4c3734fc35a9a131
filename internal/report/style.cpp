#include "style.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <optional>

namespace prepush::report {

namespace {

std::optional<fmt::text_style> TextStyle(std::string_view color) {
  if (color == "red") return fmt::fg(fmt::terminal_color::red);
  if (color == "green") return fmt::fg(fmt::terminal_color::green);
  if (color == "yellow") return fmt::fg(fmt::terminal_color::yellow);
  if (color == "blue") return fmt::fg(fmt::terminal_color::blue);
  if (color == "magenta") return fmt::fg(fmt::terminal_color::magenta);
  if (color == "cyan") return fmt::fg(fmt::terminal_color::cyan);
  if (color == "white") return fmt::fg(fmt::terminal_color::white);
  if (color == "bold") return fmt::text_style(fmt::emphasis::bold);
  if (color == "dim") return fmt::text_style(fmt::emphasis::faint);
  return std::nullopt;
}

} // namespace

std::string Style::Paint(std::string_view text, std::string_view color) const {
  if (!enabled_) {
    return std::string(text);
  }

  const auto style = TextStyle(color);
  if (!style) {
    return std::string(text);
  }
  return fmt::format(*style, "{}", text);
}

std::string FormatNs(double ns) {
  if (ns < 1e3) return fmt::format("{:.0f}ns", ns);
  if (ns < 1e6) return fmt::format("{:.1f}µs", ns / 1e3);
  if (ns < 1e9) return fmt::format("{:.1f}ms", ns / 1e6);
  return fmt::format("{:.2f}s", ns / 1e9);
}

std::string FormatSecs(double seconds) {
  return fmt::format("{:.1f}s", seconds);
}

} // namespace prepush::report
