/***
 * Name: cargo_rpl::exec::detail::MergeEnvironment
 * Purpose: Compute the child's environment from the inherited block plus overrides.
 * Inputs:
 *   - base: null-terminated NAME=value array (may be null)
 *   - overrides: (name, value) pairs to set
 * Outputs: NAME=value entries with unique names
 * Theory of Operation: Inherited entries keep their position; an overridden
 *   name is replaced at its first occurrence and later duplicates are dropped.
 *   Overrides not present in the base are appended in order.
 */
#include "cargo_rpl/exec/detail/exec.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cargo_rpl {
namespace exec {
namespace detail {

static std::string_view EntryName(std::string_view entry) {
  const std::size_t eq = entry.find('=');
  return eq == std::string_view::npos ? entry : entry.substr(0, eq);
}

auto MergeEnvironment(const char* const* base, const std::vector<EnvEntry>& overrides)
    -> std::vector<std::string> {
  std::vector<std::string> merged;
  std::vector<bool> applied(overrides.size(), false);
  for (std::size_t i = 0; base != nullptr && base[i] != nullptr; ++i) {  // NOLINT(*-pointer-arithmetic)
    const std::string_view entry{base[i]};                               // NOLINT(*-pointer-arithmetic)
    const std::string_view name = EntryName(entry);
    bool overridden = false;
    for (std::size_t k = 0; k < overrides.size(); ++k) {
      if (overrides[k].first != name) {
        continue;
      }
      overridden = true;
      if (!applied[k]) {
        merged.push_back(overrides[k].first + "=" + overrides[k].second);
        applied[k] = true;
      }
      break;
    }
    if (!overridden) {
      merged.emplace_back(entry);
    }
  }
  for (std::size_t k = 0; k < overrides.size(); ++k) {
    if (!applied[k]) {
      merged.push_back(overrides[k].first + "=" + overrides[k].second);
    }
  }
  return merged;
}

}  // namespace detail
}  // namespace exec
}  // namespace cargo_rpl
