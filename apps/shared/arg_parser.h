#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace cgate::apps {

// Option describes one flag of a subcommand. Config is the subcommand's own
// settings struct; handler stores the value into it and returns false when the
// value is unusable (after explaining why on stderr).
template <typename Config>
struct Option {
  std::string name;
  bool takes_value{true};  // NOLINT(readability-identifier-naming)
  std::string description;
  std::function<bool(Config&, const std::string& value)> handler;
};

template <typename Config>
struct ParsedOptions {
  Config config;
  std::size_t usage_errors{0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const noexcept { return usage_errors == 0; }
};

// parse_options walks argv[first..argc-1] and hands every known flag to its handler.
// Unknown flags, a missing value and a rejected value are each reported on stderr and
// counted in usage_errors; parsing continues so every problem is reported at once.
// Positional tokens are left to the caller.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int first) {
  ParsedOptions<Config> parsed{};
  std::map<std::string, const Option<Config>*, std::less<>> by_name;
  for (const auto& opt : options) {
    by_name.emplace(opt.name, &opt);
  }

  for (int i = first; i < argc; ++i) {
    const std::string token = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const auto found = by_name.find(token);
    if (found == by_name.end()) {
      if (token.size() > 1 && token.front() == '-') {
        std::cerr << "Unknown option: " << token << "\n";
        ++parsed.usage_errors;
      }
      continue;
    }

    const Option<Config>& opt = *found->second;
    std::string value;
    if (opt.takes_value) {
      if (i + 1 >= argc) {
        std::cerr << "Option " << token << " needs a value\n";
        ++parsed.usage_errors;
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt.handler(parsed.config, value)) {
      ++parsed.usage_errors;
    }
  }
  return parsed;
}

// print_options writes one aligned "  --flag <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& os, const std::vector<Option<Config>>& options) {
  std::size_t width = 0;
  for (const auto& opt : options) {
    width = std::max(width, opt.name.size() + (opt.takes_value ? 8 : 0));
  }
  for (const auto& opt : options) {
    const std::string flag = opt.name + (opt.takes_value ? " <value>" : "");
    os << "  " << std::left << std::setw(static_cast<int>(width)) << flag << "  "
       << opt.description << "\n";
  }
}

}  // namespace cgate::apps
