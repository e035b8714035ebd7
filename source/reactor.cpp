#include <wselect/reactor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace wselect {

void Reactor::want_read(int fd) {
  auto it = std::find_if(fds_.begin(), fds_.end(),
                         [fd](const pollfd &p) { return p.fd == fd; });
  if (it != fds_.end())
    return;
  fds_.push_back(pollfd{fd, POLLIN, 0});
}

int Reactor::wait(int timeout_ms) {
  if (fds_.empty())
    return 0;

  int n;
  for (;;) {
    n = ::poll(fds_.data(), fds_.size(), timeout_ms);
    if (n >= 0)
      break;
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "poll");
  }
  spdlog::trace("reactor: {} of {} fd(s) ready", n, fds_.size());
  fds_.clear();
  return n;
}

} // namespace wselect
