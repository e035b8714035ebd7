#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wselect {

struct SourceSpec {
  std::string path; // "-" - stdin
  uint32_t weight = 1;
};

struct CmdMerge {
  std::vector<SourceSpec> sources;
  std::optional<uint64_t> limit;
  bool tag = false;
  std::optional<std::string> log_level;
  int timeout_ms = -1;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdMerge, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

// PATH[:WEIGHT]; суффикс считается весом, только если он целиком из цифр.
std::optional<SourceSpec> parse_source_spec(std::string_view arg,
                                            std::string &error);

ParseResult parse_cli(int argc, char **argv);

} // namespace wselect
