#include <wselect/app.hpp>
#include <wselect/cli.hpp>
#include <wselect/line_source.hpp>
#include <wselect/log.hpp>
#include <wselect/reactor.hpp>
#include <wselect/select.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#ifndef WSELECT_VERSION
#define WSELECT_VERSION "unknown"
#endif

namespace wselect {

using LineSourcePtr = SourcePtr<std::string, IoError>;

static void print_help() {
  std::cout <<
      R"(wselect - weighted merge of line streams

Usage:
  wselect [options] SOURCE[:WEIGHT]...

SOURCE is a file, a FIFO or '-' for stdin; WEIGHT defaults to 1.
Within every round the first SOURCE gets WEIGHT lines, then the next one, ...

Options:
  --limit N          stop after N lines
  --tag              prefix every line with its source name
  --timeout-ms N     give up when no source becomes readable within N ms
  --log-level LEVEL  trace|debug|info|warn|err|critical|off
                     (default: $WSELECT_LOG_LEVEL or info)
  --help, --version
)";
}

// Префикс "имя: " к каждой строке внутреннего источника.
class TaggedSource final : public Source<std::string, IoError> {
public:
  TaggedSource(LineSourcePtr inner, const std::string &name)
      : inner_(std::move(inner)), prefix_(name + ": ") {}

  Poll<std::string, IoError> poll() override {
    auto r = inner_->poll();
    if (auto *it = std::get_if<Item<std::string>>(&r))
      it->value.insert(0, prefix_);
    return r;
  }

private:
  LineSourcePtr inner_;
  std::string prefix_;
};

int App::merge(const CmdMerge &cmd, std::ostream &out) {
  Reactor reactor;

  auto builder = make_builder<std::string, IoError>();
  for (const auto &spec : cmd.sources) {
    LineSourcePtr src = LineSource::open(spec.path, &reactor);
    if (cmd.tag)
      src = std::make_unique<TaggedSource>(std::move(src), spec.path);
    builder = std::move(builder).append(std::move(src), spec.weight);
  }
  auto sel = std::move(builder).finalize();
  spdlog::debug("{}", sel.describe());

  int rc = 0;
  uint64_t lines = 0;
  while (!cmd.limit || lines < *cmd.limit) {
    auto r = sel.poll();
    if (auto *it = std::get_if<Item<std::string>>(&r)) {
      out << it->value << '\n';
      ++lines;
    } else if (auto *f = std::get_if<Failure<IoError>>(&r)) {
      // упавший источник заглушён, остальные продолжают
      spdlog::error("read {}", f->error.message());
      rc = 1;
    } else if (is_completed(r)) {
      break;
    } else if (reactor.pending() > 0) {
      if (reactor.wait(cmd.timeout_ms) == 0 && cmd.timeout_ms >= 0) {
        spdlog::error("no input within {} ms", cmd.timeout_ms);
        rc = 1;
        break;
      }
    }
  }
  out.flush();
  spdlog::info("merged {} line(s) from {} source(s)", lines, sel.size());
  return rc;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    (void)init_logging(std::nullopt);
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("wselect {}\n", WSELECT_VERSION);
          return 0;

        } else {
          (void)init_logging(c.log_level);
          try {
            return merge(c, std::cout);
          } catch (const std::exception &e) {
            spdlog::error("{}", e.what());
            return 1;
          }
        }
      },
      *pr.cmd);
}

} // namespace wselect
