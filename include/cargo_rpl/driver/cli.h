/***
 * Name: cargo_rpl::driver (cli)
 * Purpose: Declarations for argument capture, colour selection, help and version text.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for the static parts of the CLI.
 * Theory of Operation: The process arguments are copied once into an owned
 *   vector; everything downstream works on that copy. Help and version text
 *   are constant apart from optional ANSI colour.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cargo_rpl {
namespace driver {

enum class ColorMode { Auto, Always, Never };

/***
 * Name: cargo_rpl::driver::ColorEnv
 * Purpose: Raw values of the environment variables that steer colour output.
 * Inputs: CARGO_TERM_COLOR, NO_COLOR, CLICOLOR_FORCE
 * Outputs: Consumed by ShouldColorize.
 */
struct ColorEnv {
  std::optional<std::string> term_color;
  std::optional<std::string> no_color;
  std::optional<std::string> clicolor_force;

  static ColorEnv FromProcess();
};

/*** ParseColorMode: "always" / "never" / anything else → Auto (case-insensitive). */
ColorMode ParseColorMode(std::string_view value);

/***
 * Name: cargo_rpl::driver::ShouldColorize
 * Purpose: Decide whether help output gets ANSI colour.
 * Inputs: env (colour variables), is_terminal (stdout is a tty)
 * Outputs: true to colour
 * Theory of Operation: An explicit CARGO_TERM_COLOR wins; then a non-empty
 *   NO_COLOR disables; then CLICOLOR_FORCE (anything but "0") enables;
 *   otherwise colour only on a terminal.
 */
bool ShouldColorize(const ColorEnv& env, bool is_terminal);

/*** StdoutIsTerminal: isatty(STDOUT_FILENO). */
bool StdoutIsTerminal();

/*** RenderHelp: Help text, with ANSI sequences when color is true. */
std::string RenderHelp(bool color);

/*** PrintHelp: Write RenderHelp(color) to out. */
void PrintHelp(std::ostream& out, bool color);

/*** VersionText: "rpl X.Y.Z" plus " (<hash> <date>)" when both are known. */
std::string VersionText();

/*** PrintVersion: Write VersionText() and a newline to out. */
void PrintVersion(std::ostream& out);

namespace detail {

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RenderMarkup: Replace {h} {f} {a} {r} style markers with ANSI codes or nothing. */
std::string RenderMarkup(std::string_view text, bool color);

}  // namespace detail

}  // namespace driver
}  // namespace cargo_rpl
