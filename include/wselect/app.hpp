#pragma once
#include "cli.hpp"

#include <ostream>

namespace wselect {

class App {
public:
  int run(int argc, char **argv);

  // Сливает строки источников в out. 0 - успех, 1 - ошибка источника.
  static int merge(const CmdMerge &cmd, std::ostream &out);
};

} // namespace wselect
