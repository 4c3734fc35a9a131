#pragma once

#include <string>
#include <string_view>

namespace prepush::report {

inline constexpr const char* kSymPass = "✓";
inline constexpr const char* kSymFail = "✗";
inline constexpr const char* kSymWarn = "⚠";
inline constexpr const char* kSymNew  = "○";
inline constexpr const char* kSymSkip = "─";

/*
  Minimal ANSI styling. Colors are the names used in lane configuration
  (cyan, magenta, yellow, blue, green, red, white) plus "bold" and "dim".
  Unknown names and disabled styling return the text unchanged.
*/
class Style {
 public:
  explicit Style(bool enabled) : enabled_(enabled) {
  }

  std::string Paint(std::string_view text, std::string_view color) const;

  bool enabled() const {
    return enabled_;
  }

 private:
  bool enabled_;
};

// "850ns", "12.3µs", "4.5ms", "1.25s"
std::string FormatNs(double ns);

// "12.3s"
std::string FormatSecs(double seconds);

} // namespace prepush::report
