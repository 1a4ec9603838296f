#ifndef PFRELAY_HELPERS_ARGS_HPP
#define PFRELAY_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the daemon.
 *
 * Fixed-arity parser: a matched flag consumes the next nargs tokens literally.
 * Unlike a diagnostic tool, a daemon rejects unrecognized tokens so that a
 * mistyped flag never silently falls back to defaults.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace pfrelay {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--config"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 * @param args  Argument list without the program name (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output map of parsed values (entries are overwritten per key).
 * @param error Set to a description on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      error = fmt::format("Unrecognized argument '{}'", TOK);
      return false;
    }

    const std::uint8_t KEY = it->second.first;
    const ArgDef& DEF = *it->second.second;

    if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
      error = fmt::format("Argument out of bounds: expected {} values for flag '{}'", DEF.nargs,
                          DEF.flag);
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    out.reserve(DEF.nargs);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      error = fmt::format("Missing required argument '{}'", KV.second.flag);
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the program.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs > 0) {
      flagStr.append(" <value>");
    }
    fmt::print("  {:<24}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace pfrelay

#endif // PFRELAY_HELPERS_ARGS_HPP
