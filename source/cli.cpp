#include <wselect/cli.hpp>
#include <wselect/log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

namespace wselect {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool all_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

template <class N> static bool parse_num(std::string_view s, N &out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && p == s.data() + s.size();
}

std::optional<SourceSpec> parse_source_spec(std::string_view arg,
                                            std::string &error) {
  SourceSpec spec;
  auto colon = arg.rfind(':');
  if (colon != std::string_view::npos && all_digits(arg.substr(colon + 1))) {
    uint64_t w = 0;
    if (!parse_num(arg.substr(colon + 1), w) ||
        w > std::numeric_limits<uint32_t>::max()) {
      error = "weight out of range: " + std::string(arg);
      return std::nullopt;
    }
    if (w == 0) {
      error = "weight must be >= 1: " + std::string(arg);
      return std::nullopt;
    }
    spec.weight = static_cast<uint32_t>(w);
    arg = arg.substr(0, colon);
  }
  if (arg.empty()) {
    error = "empty source path";
    return std::nullopt;
  }
  spec.path = std::string(arg);
  return spec;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  CmdMerge c{};
  bool only_sources = false;
  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];

    bool is_opt = a == "-h" || (a.size() > 2 && a.substr(0, 2) == "--") ||
                  a == "--";
    if (!only_sources && is_opt) {
      if (a == "--") {
        only_sources = true;
      } else if (a == "-h" || a == "--help") {
        r.cmd = CmdHelp{};
        return r;
      } else if (a == "--version") {
        r.cmd = CmdVersion{};
        return r;
      } else if (a == "--tag") {
        c.tag = true;
      } else if (a == "--limit" && has_arg(i, argc)) {
        uint64_t n = 0;
        if (!parse_num(std::string_view(argv[++i]), n)) {
          r.error = std::string("--limit: not a number: ") + argv[i];
          return r;
        }
        c.limit = n;
      } else if (a == "--timeout-ms" && has_arg(i, argc)) {
        int t = 0;
        if (!parse_num(std::string_view(argv[++i]), t)) {
          r.error = std::string("--timeout-ms: not a number: ") + argv[i];
          return r;
        }
        c.timeout_ms = t;
      } else if (a == "--log-level" && has_arg(i, argc)) {
        std::string lvl = argv[++i];
        if (!parse_level(lvl)) {
          r.error = "--log-level: unknown level: " + lvl;
          return r;
        }
        c.log_level = lvl;
      } else {
        r.error = "unknown option: " + std::string(a);
        return r;
      }
      continue;
    }

    std::string err;
    auto spec = parse_source_spec(a, err);
    if (!spec) {
      r.error = err;
      return r;
    }
    if (spec->path == "-" &&
        std::any_of(c.sources.begin(), c.sources.end(),
                    [](const SourceSpec &s) { return s.path == "-"; })) {
      r.error = "stdin ('-') may be given only once";
      return r;
    }
    c.sources.push_back(std::move(*spec));
  }

  if (c.sources.empty()) {
    r.error = "at least one SOURCE required";
    return r;
  }
  r.cmd = std::move(c);
  return r;
}

} // namespace wselect
