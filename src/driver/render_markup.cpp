/***
 * Name: cargo_rpl::driver::detail::RenderMarkup
 * Purpose: Expand colour markers in static text.
 * Inputs:
 *   - text: template containing {h} (heading), {f} (flag), {a} (argument), {r} (reset)
 *   - color: emit ANSI sequences when true, drop markers otherwise
 * Outputs: Rendered text
 * Theory of Operation: Linear scan; unknown {..} sequences are copied verbatim.
 */
#include "cargo_rpl/driver/cli.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace cargo_rpl::driver::detail {

namespace {
// ANSI fragments
constexpr std::string_view kGreenBold = "\033[1m\033[32m";
constexpr std::string_view kCyanBold = "\033[1m\033[36m";
constexpr std::string_view kCyan = "\033[36m";
constexpr std::string_view kReset = "\033[0m";

constexpr std::array<std::pair<std::string_view, std::string_view>, 4> kMarkers{{
    {"{h}", kGreenBold},
    {"{f}", kCyanBold},
    {"{a}", kCyan},
    {"{r}", kReset},
}};
}  // namespace

auto RenderMarkup(const std::string_view text, const bool color) -> std::string {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    bool matched = false;
    if (text[pos] == '{') {
      for (const auto& [marker, ansi] : kMarkers) {
        if (text.compare(pos, marker.size(), marker) == 0) {
          if (color) {
            out += ansi;
          }
          pos += marker.size();
          matched = true;
          break;
        }
      }
    }
    if (!matched) {
      out += text[pos];
      ++pos;
    }
  }
  return out;
}

}  // namespace cargo_rpl::driver::detail
