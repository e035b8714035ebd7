#include <wselect/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace wselect {

std::optional<spdlog::level::level_enum> parse_level(const std::string &s) {
  auto lvl = spdlog::level::from_str(s);
  // from_str отдаёт off для всего, что не распознал
  if (lvl == spdlog::level::off && s != "off")
    return std::nullopt;
  return lvl;
}

bool init_logging(const std::optional<std::string> &level) {
  auto logger = spdlog::get("wselect");
  if (!logger)
    logger = spdlog::stderr_color_mt("wselect");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  std::string name = "info";
  if (level)
    name = *level;
  else if (const char *e = std::getenv("WSELECT_LOG_LEVEL"))
    name = e;

  auto lvl = parse_level(name);
  if (!lvl) {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("unknown log level '{}', using info", name);
    return false;
  }
  spdlog::set_level(*lvl);
  return true;
}

} // namespace wselect
