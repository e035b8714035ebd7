#pragma once
#include <cstddef>
#include <vector>

#include <poll.h>

namespace wselect {

// Минимальный реактор готовности: источник, получивший EAGAIN,
// регистрирует интерес через want_read() перед тем как вернуть NotReady,
// а хост ждёт в wait().
class Reactor {
public:
  void want_read(int fd);

  // Ждёт готовности хотя бы одного зарегистрированного дескриптора и
  // сбрасывает регистрации. timeout_ms < 0 - без ограничения.
  // Возвращает число готовых дескрипторов (0 - таймаут или ничего не ждали).
  int wait(int timeout_ms = -1);

  size_t pending() const { return fds_.size(); }

private:
  std::vector<pollfd> fds_;
};

} // namespace wselect
