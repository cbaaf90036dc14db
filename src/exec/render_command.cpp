/***
 * Name: cargo_rpl::exec::RenderCommand
 * Purpose: Render a Command as one readable line for debug logs.
 * Inputs: command
 * Outputs: "NAME='value' ... program 'arg' ..."
 * Theory of Operation: Single-quotes tokens that are empty or contain shell
 *   metacharacters; embedded quotes use the '\'' idiom.
 */
#include "cargo_rpl/exec/command.h"

#include <sstream>
#include <string>

namespace cargo_rpl::exec {

static std::string Quote(const std::string& token) {
  if (!token.empty() && token.find_first_of(" \t\n'\"\\$`*?;&|<>()") == std::string::npos) {
    return token;
  }
  std::string quoted{"'"};
  for (const char ch : token) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted += ch;
    }
  }
  quoted += '\'';
  return quoted;
}

auto RenderCommand(const Command& command) -> std::string {
  std::ostringstream line;
  for (const auto& [name, value] : command.env) {
    line << name << '=' << Quote(value) << ' ';
  }
  line << Quote(command.program);
  for (const auto& arg : command.args) {
    line << ' ' << Quote(arg);
  }
  return line.str();
}

}  // namespace cargo_rpl::exec
