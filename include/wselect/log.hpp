#pragma once
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace wselect {

std::optional<spdlog::level::level_enum> parse_level(const std::string &s);

// Логгер в stderr (stdout занят данными). Уровень: явный аргумент,
// затем WSELECT_LOG_LEVEL, затем info. Возвращает false при неизвестном уровне.
bool init_logging(const std::optional<std::string> &level);

} // namespace wselect
